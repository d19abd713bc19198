/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <gbc/cpu/sm83.h>

#include <gbc/cpu/sm83_decoder_table_gen.h>

namespace gbc::cpu {

namespace {

constexpr decoder_table_generator::decoder_table instruction_table = decoder_table_generator::generate_table();
constexpr decoder_table_generator::decoder_table prefixed_table = decoder_table_generator::generate_prefixed_table();
constexpr decoder_table_generator::info_table instruction_infos = decoder_table_generator::generate_info_table();
constexpr decoder_table_generator::info_table prefixed_infos = decoder_table_generator::generate_prefixed_info_table();

} // namespace

u32 sm83::step() noexcept
{
    switch(state_) {
        case execution_state::locked:
            return 0_u32;
        case execution_state::stopped:
            return idle_cycles;
        case execution_state::halted:
            if(!interrupts_.any_pending()) {
                return idle_cycles;
            }
            state_ = execution_state::running;
            break;
        case execution_state::running:
            break;
        default:
            UNREACHABLE();
    }

    if(ime_ && interrupts_.any_pending()) {
        dispatch_interrupt();
        return interrupt_dispatch_cycles;
    }

    const u32 cycles = execute();

    if(ime_delay_ != 0_u8) {
        --ime_delay_;
        if(ime_delay_ == 0_u8) {
            ime_ = true;
        }
    }
    return cycles;
}

void sm83::dispatch_interrupt() noexcept
{
    ime_ = false;
    ime_delay_ = 0_u8;

    // IE may be overwritten by the upper pc push, the target is picked in between the pushes
    --r_.sp;
    write_8(r_.sp, r_.pc.high_byte());
    const std::optional<interrupt_source> source = interrupts_.highest_priority_pending();
    --r_.sp;
    write_8(r_.sp, r_.pc.low_byte());

    if(!source.has_value()) {
        LOG_TRACE(cpu, "interrupt dispatch cancelled, jumping to 0000");
        r_.pc = 0x0000_u16;
        return;
    }

    interrupts_.acknowledge(*source);
    r_.pc = interrupt_controller::vector_for(*source);
}

u32 sm83::execute() noexcept
{
    instruction_address_ = r_.pc;
    if(UNLIKELY(halt_bug_)) {
        // pc fails to increment after halt
        halt_bug_ = false;
        opcode_ = read_8(r_.pc);
    } else {
        opcode_ = fetch_8();
    }

    branch_taken_ = false;
    auto func = instruction_table[opcode_];
    ASSERT(func.is_valid());
    func(this);

    if(UNLIKELY(state_ == execution_state::locked)) {
        return idle_cycles;
    }

    const instruction_info info = opcode_ == 0xCB_u8
      ? prefixed_instruction_info_for(prefixed_opcode_)
      : instruction_info_for(opcode_);
    return widen<u32>(branch_taken_ ? info.cycles_taken : info.cycles);
}

void sm83::push_16(const u16 data) noexcept
{
    --r_.sp;
    write_8(r_.sp, data.high_byte());
    --r_.sp;
    write_8(r_.sp, data.low_byte());
}

u16 sm83::pop_16() noexcept
{
    const u8 low = read_8(r_.sp++);
    const u8 high = read_8(r_.sp++);
    return u16::from_bytes(high, low);
}

u8 sm83::shift(const shift_opcode op, const u8 data) noexcept
{
    u8 result;
    bool carry;
    switch(op) {
        case shift_opcode::rlc:
            carry = data.test_bit(7_u8);
            result = (data << 1_u8) | (data >> 7_u8);
            break;
        case shift_opcode::rrc:
            carry = data.test_bit(0_u8);
            result = (data >> 1_u8) | (data << 7_u8);
            break;
        case shift_opcode::rl:
            carry = data.test_bit(7_u8);
            result = (data << 1_u8) | bit::from_bool<u8>(r_.f.carry);
            break;
        case shift_opcode::rr:
            carry = data.test_bit(0_u8);
            result = (data >> 1_u8) | (bit::from_bool<u8>(r_.f.carry) << 7_u8);
            break;
        case shift_opcode::sla:
            carry = data.test_bit(7_u8);
            result = data << 1_u8;
            break;
        case shift_opcode::sra:
            carry = data.test_bit(0_u8);
            result = (data >> 1_u8) | (data & 0x80_u8);
            break;
        case shift_opcode::swap:
            carry = false;
            result = data.swapped_nibbles();
            break;
        case shift_opcode::srl:
            carry = data.test_bit(0_u8);
            result = data >> 1_u8;
            break;
        default:
            UNREACHABLE();
    }

    r_.f.zero = result == 0_u8;
    r_.f.subtract = false;
    r_.f.half_carry = false;
    r_.f.carry = carry;
    return result;
}

void sm83::alu(const alu_opcode op, const u8 operand) noexcept
{
    switch(op) {
        case alu_opcode::add:
        case alu_opcode::adc: {
            const math::arithmetic_result<u8> res = math::add_8(r_.a, operand, op == alu_opcode::adc && r_.f.carry);
            r_.a = res.result;
            r_.f.zero = res.result == 0_u8;
            r_.f.subtract = false;
            r_.f.half_carry = res.half_carry;
            r_.f.carry = res.carry;
            break;
        }
        case alu_opcode::sub:
        case alu_opcode::sbc:
        case alu_opcode::cp: {
            const math::arithmetic_result<u8> res = math::sub_8(r_.a, operand, op == alu_opcode::sbc && r_.f.carry);
            if(op != alu_opcode::cp) {
                r_.a = res.result;
            }
            r_.f.zero = res.result == 0_u8;
            r_.f.subtract = true;
            r_.f.half_carry = res.half_carry;
            r_.f.carry = res.carry;
            break;
        }
        case alu_opcode::and_:
            r_.a &= operand;
            r_.f.zero = r_.a == 0_u8;
            r_.f.subtract = false;
            r_.f.half_carry = true;
            r_.f.carry = false;
            break;
        case alu_opcode::xor_:
            r_.a ^= operand;
            r_.f.zero = r_.a == 0_u8;
            r_.f.subtract = false;
            r_.f.half_carry = false;
            r_.f.carry = false;
            break;
        case alu_opcode::or_:
            r_.a |= operand;
            r_.f.zero = r_.a == 0_u8;
            r_.f.subtract = false;
            r_.f.half_carry = false;
            r_.f.carry = false;
            break;
        default:
            UNREACHABLE();
    }
}

// flags come from the unsigned addition on the low byte of sp
u16 sm83::add_sp_offset(const u8 offset) noexcept
{
    const u16 operand = offset.sign_extended();
    r_.f.zero = false;
    r_.f.subtract = false;
    r_.f.half_carry = (r_.sp & 0x000F_u16) + widen<u16>(offset & 0x0F_u8) > 0x000F_u16;
    r_.f.carry = (r_.sp & 0x00FF_u16) + widen<u16>(offset) > 0x00FF_u16;
    return r_.sp + operand;
}

void sm83::undefined() noexcept
{
    state_ = execution_state::locked;
    fault_opcode_ = opcode_;
    fault_address_ = instruction_address_;
    LOG_ERROR(cpu, "undefined opcode {:02X} at {:04X}, cpu is locked", opcode_, instruction_address_);
}

void sm83::stop() noexcept
{
    fetch_8(); // padding byte

    if(cgb_mode_ && speed_switch_armed_) {
        speed_switch_armed_ = false;
        double_speed_ = !double_speed_;
        LOG_DEBUG(cpu, "switched to {} speed", double_speed_ ? "double" : "normal");
        if(on_speed_switch) {
            on_speed_switch();
        }
        return;
    }

    LOG_TRACE(cpu, "stopped at {:04X}", instruction_address_);
    state_ = execution_state::stopped;
}

void sm83::halt() noexcept
{
    if(ime_ || ime_delay_ != 0_u8 || !interrupts_.any_pending()) {
        state_ = execution_state::halted;
        return;
    }

    halt_bug_ = true;
}

void sm83::di() noexcept
{
    ime_ = false;
    ime_delay_ = 0_u8;
}

void sm83::ei() noexcept
{
    if(!ime_ && ime_delay_ == 0_u8) {
        ime_delay_ = 2_u8;
    }
}

void sm83::prefix_cb() noexcept
{
    prefixed_opcode_ = fetch_8();
    auto func = prefixed_table[prefixed_opcode_];
    ASSERT(func.is_valid());
    func(this);
}

void sm83::ld_a16_sp() noexcept
{
    const u16 addr = fetch_16();
    write_8(addr, r_.sp.low_byte());
    write_8(addr + 1_u16, r_.sp.high_byte());
}

void sm83::jr() noexcept
{
    const u8 offset = fetch_8();
    r_.pc = relative_target(offset);
}

void sm83::jp() noexcept
{
    r_.pc = fetch_16();
}

void sm83::jp_hl() noexcept
{
    r_.pc = r_.hl();
}

void sm83::call() noexcept
{
    const u16 addr = fetch_16();
    push_16(r_.pc);
    r_.pc = addr;
}

void sm83::ret() noexcept
{
    r_.pc = pop_16();
}

void sm83::reti() noexcept
{
    r_.pc = pop_16();
    ime_ = true;
    ime_delay_ = 0_u8;
}

void sm83::daa() noexcept
{
    u8 correction;
    bool carry = r_.f.carry;
    if(r_.f.subtract) {
        if(r_.f.half_carry) {
            correction |= 0x06_u8;
        }
        if(r_.f.carry) {
            correction |= 0x60_u8;
        }
        r_.a = r_.a - correction;
    } else {
        if(r_.f.half_carry || r_.a.low_nibble() > 0x09_u8) {
            correction |= 0x06_u8;
        }
        if(r_.f.carry || r_.a > 0x99_u8) {
            correction |= 0x60_u8;
            carry = true;
        }
        r_.a = r_.a + correction;
    }

    r_.f.zero = r_.a == 0_u8;
    r_.f.half_carry = false;
    r_.f.carry = carry;
}

void sm83::cpl() noexcept
{
    r_.a = ~r_.a;
    r_.f.subtract = true;
    r_.f.half_carry = true;
}

void sm83::scf() noexcept
{
    r_.f.subtract = false;
    r_.f.half_carry = false;
    r_.f.carry = true;
}

void sm83::ccf() noexcept
{
    r_.f.subtract = false;
    r_.f.half_carry = false;
    r_.f.carry = !r_.f.carry;
}

void sm83::add_sp_r8() noexcept
{
    r_.sp = add_sp_offset(fetch_8());
}

void sm83::ld_hl_sp_r8() noexcept
{
    r_.set_hl(add_sp_offset(fetch_8()));
}

void sm83::ld_sp_hl() noexcept
{
    r_.sp = r_.hl();
}

u8 sm83::read_key1() const noexcept
{
    if(!cgb_mode_) {
        return 0xFF_u8;
    }
    return 0x7E_u8 | (bit::from_bool<u8>(double_speed_) << 7_u8) | bit::from_bool<u8>(speed_switch_armed_);
}

void sm83::write_key1(const u8 data) noexcept
{
    if(cgb_mode_) {
        speed_switch_armed_ = data.test_bit(0_u8);
    }
}

void sm83::wake_from_stop() noexcept
{
    if(state_ == execution_state::stopped) {
        LOG_TRACE(cpu, "woken up from stop");
        state_ = execution_state::running;
    }
}

instruction_info sm83::instruction_info_for(const u8 opcode) noexcept
{
    return instruction_infos[opcode];
}

instruction_info sm83::prefixed_instruction_info_for(const u8 opcode) noexcept
{
    return prefixed_infos[opcode];
}

} // namespace gbc::cpu
