/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_SM83_H
#define GAMEBOICOLOR_SM83_H

#include <gbc/core/event/delegate.h>
#include <gbc/core/fwd.h>
#include <gbc/core/math.h>
#include <gbc/cpu/bus_interface.h>
#include <gbc/cpu/interrupt_controller.h>

namespace gbc::cpu {

class decoder_table_generator;

struct instruction_info {
    u8 length;
    u8 cycles;
    u8 cycles_taken;  // conditional instructions only, equals cycles otherwise
};

struct flag_register {
    bool zero = false;
    bool subtract = false;
    bool half_carry = false;
    bool carry = false;

    [[nodiscard]] u8 read() const noexcept
    {
        return bit::from_bool<u8>(zero) << 7_u8
          | bit::from_bool<u8>(subtract) << 6_u8
          | bit::from_bool<u8>(half_carry) << 5_u8
          | bit::from_bool<u8>(carry) << 4_u8;
    }

    void write(const u8 data) noexcept
    {
        zero = data.test_bit(7_u8);
        subtract = data.test_bit(6_u8);
        half_carry = data.test_bit(5_u8);
        carry = data.test_bit(4_u8);
    }
};

struct register_file {
    u8 a;
    flag_register f;
    u8 b;
    u8 c;
    u8 d;
    u8 e;
    u8 h;
    u8 l;
    u16 sp;
    u16 pc;

    [[nodiscard]] u16 af() const noexcept { return u16::from_bytes(a, f.read()); }
    [[nodiscard]] u16 bc() const noexcept { return u16::from_bytes(b, c); }
    [[nodiscard]] u16 de() const noexcept { return u16::from_bytes(d, e); }
    [[nodiscard]] u16 hl() const noexcept { return u16::from_bytes(h, l); }

    void set_af(const u16 v) noexcept { a = v.high_byte(); f.write(v.low_byte()); }
    void set_bc(const u16 v) noexcept { b = v.high_byte(); c = v.low_byte(); }
    void set_de(const u16 v) noexcept { d = v.high_byte(); e = v.low_byte(); }
    void set_hl(const u16 v) noexcept { h = v.high_byte(); l = v.low_byte(); }

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(af());
        archive.serialize(bc());
        archive.serialize(de());
        archive.serialize(hl());
        archive.serialize(sp);
        archive.serialize(pc);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        set_af(archive.template deserialize<u16>());
        set_bc(archive.template deserialize<u16>());
        set_de(archive.template deserialize<u16>());
        set_hl(archive.template deserialize<u16>());
        archive.deserialize(sp);
        archive.deserialize(pc);
    }
};

/**
 * Sharp SM83 interpreter. step() either dispatches one interrupt or executes one instruction
 * and returns its cost in clock cycles (4 per machine cycle).
 */
class sm83 {
    friend core;
    friend decoder_table_generator;

public:
    enum class execution_state : u8::type { running, halted, stopped, locked };

    static inline constexpr auto addr_key1 = 0xFF4D_u16;

    static constexpr u32 interrupt_dispatch_cycles = 20_u32;
    static constexpr u32 idle_cycles = 4_u32;

private:
    enum class condition : u8::type { nz, z, nc, c };
    enum class alu_opcode : u8::type { add, adc, sub, sbc, and_, xor_, or_, cp };
    enum class shift_opcode : u8::type { rlc, rrc, rl, rr, sla, sra, swap, srl };

    bus_interface* bus_;
    interrupt_controller interrupts_;

    register_file r_;
    execution_state state_{execution_state::running};
    bool ime_ = false;
    u8 ime_delay_;  // EI takes effect after the following instruction
    bool halt_bug_ = false;
    bool branch_taken_ = false;

    bool cgb_mode_ = false;
    bool double_speed_ = false;
    bool speed_switch_armed_ = false;

    u16 instruction_address_;
    u8 opcode_;
    u8 prefixed_opcode_;
    u8 fault_opcode_;
    u16 fault_address_;

public:
    /** Called after STOP switched the clock speed. */
    delegate<void()> on_speed_switch;

    explicit sm83(bus_interface* bus) noexcept
      : bus_{bus} {}

    u32 step() noexcept;

    [[nodiscard]] register_file& registers() noexcept { return r_; }
    [[nodiscard]] const register_file& registers() const noexcept { return r_; }
    [[nodiscard]] interrupt_controller& interrupts() noexcept { return interrupts_; }
    [[nodiscard]] irq_controller_handle get_interrupt_handle() noexcept { return irq_controller_handle{&interrupts_}; }

    [[nodiscard]] execution_state state() const noexcept { return state_; }
    [[nodiscard]] bool locked() const noexcept { return state_ == execution_state::locked; }
    [[nodiscard]] bool interrupts_enabled() const noexcept { return ime_; }
    [[nodiscard]] u8 fault_opcode() const noexcept { return fault_opcode_; }
    [[nodiscard]] u16 fault_address() const noexcept { return fault_address_; }

    void set_cgb_mode(const bool cgb_mode) noexcept { cgb_mode_ = cgb_mode; }
    [[nodiscard]] bool double_speed() const noexcept { return double_speed_; }
    [[nodiscard]] u8 read_key1() const noexcept;
    void write_key1(u8 data) noexcept;

    void wake_from_stop() noexcept;

    [[nodiscard]] static instruction_info instruction_info_for(u8 opcode) noexcept;
    [[nodiscard]] static instruction_info prefixed_instruction_info_for(u8 opcode) noexcept;

    template<typename Ar>
    void serialize(Ar& archive) const noexcept
    {
        archive.serialize(interrupts_);
        archive.serialize(r_);
        archive.serialize(state_);
        archive.serialize(ime_);
        archive.serialize(ime_delay_);
        archive.serialize(halt_bug_);
        archive.serialize(double_speed_);
        archive.serialize(speed_switch_armed_);
        archive.serialize(fault_opcode_);
        archive.serialize(fault_address_);
    }

    template<typename Ar>
    void deserialize(const Ar& archive) noexcept
    {
        archive.deserialize(interrupts_);
        archive.deserialize(r_);
        archive.deserialize(state_);
        archive.deserialize(ime_);
        archive.deserialize(ime_delay_);
        archive.deserialize(halt_bug_);
        archive.deserialize(double_speed_);
        archive.deserialize(speed_switch_armed_);
        archive.deserialize(fault_opcode_);
        archive.deserialize(fault_address_);
        if(from_enum<u8>(state_) > from_enum<u8>(execution_state::locked)) {
            archive.mark_corrupted();
        }
    }

private:
    void dispatch_interrupt() noexcept;
    [[nodiscard]] u32 execute() noexcept;

    [[nodiscard]] u8 read_8(const u16 addr) noexcept { return bus_->read_8(addr, mem_access::cpu); }
    void write_8(const u16 addr, const u8 data) noexcept { bus_->write_8(addr, data, mem_access::cpu); }

    u8 fetch_8() noexcept { return read_8(r_.pc++); }
    u16 fetch_16() noexcept
    {
        const u8 low = fetch_8();
        return u16::from_bytes(fetch_8(), low);
    }

    void push_16(u16 data) noexcept;
    u16 pop_16() noexcept;

    // register operand index 0-7: B C D E H L (HL) A
    template<u8::type R> u8 read_r() noexcept;
    template<u8::type R> void write_r(u8 data) noexcept;

    // register pair index 0-3: BC DE HL SP
    template<u8::type P> [[nodiscard]] u16 read_rr() const noexcept;
    template<u8::type P> void write_rr(u16 data) noexcept;

    template<condition Cond> [[nodiscard]] bool check_condition() const noexcept;

    u8 shift(shift_opcode op, u8 data) noexcept;
    void alu(alu_opcode op, u8 operand) noexcept;
    u16 add_sp_offset(u8 offset) noexcept;
    [[nodiscard]] u16 relative_target(const u8 offset) const noexcept
    {
        return r_.pc + offset.sign_extended();
    }

    // isa, sm83_isa.inl
    void nop() noexcept {}
    void undefined() noexcept;
    void stop() noexcept;
    void halt() noexcept;
    void di() noexcept;
    void ei() noexcept;
    void prefix_cb() noexcept;

    template<u8::type P> void ld_rr_d16() noexcept;
    template<u8::type Idx, bool ToA> void ld_indirect() noexcept;
    template<u8::type P, bool Dec> void inc_dec_rr() noexcept;
    template<u8::type R> void inc_r() noexcept;
    template<u8::type R> void dec_r() noexcept;
    template<u8::type R> void ld_r_d8() noexcept;
    template<u8::type Dst, u8::type Src> void ld_r_r() noexcept;
    template<shift_opcode Op> void rotate_a() noexcept;
    void ld_a16_sp() noexcept;
    template<u8::type P> void add_hl_rr() noexcept;

    void jr() noexcept;
    template<condition Cond> void jr_cc() noexcept;
    void jp() noexcept;
    template<condition Cond> void jp_cc() noexcept;
    void jp_hl() noexcept;
    void call() noexcept;
    template<condition Cond> void call_cc() noexcept;
    void ret() noexcept;
    template<condition Cond> void ret_cc() noexcept;
    void reti() noexcept;
    template<u8::type Vector> void rst() noexcept;

    void daa() noexcept;
    void cpl() noexcept;
    void scf() noexcept;
    void ccf() noexcept;

    template<alu_opcode Op, u8::type R> void alu_r() noexcept;
    template<alu_opcode Op> void alu_d8() noexcept;

    template<u8::type P> void push_rr() noexcept;
    template<u8::type P> void pop_rr() noexcept;

    template<bool ToA> void ldh_a8() noexcept;
    template<bool ToA> void ldh_c() noexcept;
    template<bool ToA> void ld_a16() noexcept;
    void add_sp_r8() noexcept;
    void ld_hl_sp_r8() noexcept;
    void ld_sp_hl() noexcept;

    // prefixed
    template<shift_opcode Op, u8::type R> void shift_r() noexcept;
    template<u8::type Bit, u8::type R> void bit_r() noexcept;
    template<u8::type Bit, u8::type R> void res_r() noexcept;
    template<u8::type Bit, u8::type R> void set_r() noexcept;
};

} // namespace gbc::cpu

#include <gbc/cpu/sm83_isa.inl>

#endif //GAMEBOICOLOR_SM83_H
