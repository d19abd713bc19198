/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_SM83_ISA_INL
#define GAMEBOICOLOR_SM83_ISA_INL

namespace gbc::cpu {

template<u8::type R>
u8 sm83::read_r() noexcept
{
    static_assert(R < 8);
    if constexpr(R == 0) { return r_.b; }
    else if constexpr(R == 1) { return r_.c; }
    else if constexpr(R == 2) { return r_.d; }
    else if constexpr(R == 3) { return r_.e; }
    else if constexpr(R == 4) { return r_.h; }
    else if constexpr(R == 5) { return r_.l; }
    else if constexpr(R == 6) { return read_8(r_.hl()); }
    else { return r_.a; }
}

template<u8::type R>
void sm83::write_r(const u8 data) noexcept
{
    static_assert(R < 8);
    if constexpr(R == 0) { r_.b = data; }
    else if constexpr(R == 1) { r_.c = data; }
    else if constexpr(R == 2) { r_.d = data; }
    else if constexpr(R == 3) { r_.e = data; }
    else if constexpr(R == 4) { r_.h = data; }
    else if constexpr(R == 5) { r_.l = data; }
    else if constexpr(R == 6) { write_8(r_.hl(), data); }
    else { r_.a = data; }
}

template<u8::type P>
u16 sm83::read_rr() const noexcept
{
    static_assert(P < 4);
    if constexpr(P == 0) { return r_.bc(); }
    else if constexpr(P == 1) { return r_.de(); }
    else if constexpr(P == 2) { return r_.hl(); }
    else { return r_.sp; }
}

template<u8::type P>
void sm83::write_rr(const u16 data) noexcept
{
    static_assert(P < 4);
    if constexpr(P == 0) { r_.set_bc(data); }
    else if constexpr(P == 1) { r_.set_de(data); }
    else if constexpr(P == 2) { r_.set_hl(data); }
    else { r_.sp = data; }
}

template<sm83::condition Cond>
bool sm83::check_condition() const noexcept
{
    switch(Cond) {
        case condition::nz: return !r_.f.zero;
        case condition::z:  return r_.f.zero;
        case condition::nc: return !r_.f.carry;
        case condition::c:  return r_.f.carry;
        default:
            UNREACHABLE();
    }
}

template<u8::type P>
void sm83::ld_rr_d16() noexcept
{
    write_rr<P>(fetch_16());
}

// Idx 0-3: (BC) (DE) (HL+) (HL-)
template<u8::type Idx, bool ToA>
void sm83::ld_indirect() noexcept
{
    u16 addr;
    if constexpr(Idx == 0) {
        addr = r_.bc();
    } else if constexpr(Idx == 1) {
        addr = r_.de();
    } else {
        addr = r_.hl();
        r_.set_hl(Idx == 2 ? addr + 1_u16 : addr - 1_u16);
    }

    if constexpr(ToA) {
        r_.a = read_8(addr);
    } else {
        write_8(addr, r_.a);
    }
}

template<u8::type P, bool Dec>
void sm83::inc_dec_rr() noexcept
{
    if constexpr(Dec) {
        write_rr<P>(read_rr<P>() - 1_u16);
    } else {
        write_rr<P>(read_rr<P>() + 1_u16);
    }
}

template<u8::type R>
void sm83::inc_r() noexcept
{
    const u8 data = read_r<R>();
    const u8 result = data + 1_u8;
    r_.f.zero = result == 0_u8;
    r_.f.subtract = false;
    r_.f.half_carry = data.low_nibble() == 0x0F_u8;
    write_r<R>(result);
}

template<u8::type R>
void sm83::dec_r() noexcept
{
    const u8 data = read_r<R>();
    const u8 result = data - 1_u8;
    r_.f.zero = result == 0_u8;
    r_.f.subtract = true;
    r_.f.half_carry = data.low_nibble() == 0x00_u8;
    write_r<R>(result);
}

template<u8::type R>
void sm83::ld_r_d8() noexcept
{
    write_r<R>(fetch_8());
}

template<u8::type Dst, u8::type Src>
void sm83::ld_r_r() noexcept
{
    write_r<Dst>(read_r<Src>());
}

template<sm83::shift_opcode Op>
void sm83::rotate_a() noexcept
{
    r_.a = shift(Op, r_.a);
    r_.f.zero = false;
}

template<u8::type P>
void sm83::add_hl_rr() noexcept
{
    const math::arithmetic_result<u16> result = math::add_16(r_.hl(), read_rr<P>());
    r_.set_hl(result.result);
    r_.f.subtract = false;
    r_.f.half_carry = result.half_carry;
    r_.f.carry = result.carry;
}

template<sm83::condition Cond>
void sm83::jr_cc() noexcept
{
    const u8 offset = fetch_8();
    if(check_condition<Cond>()) {
        r_.pc = relative_target(offset);
        branch_taken_ = true;
    }
}

template<sm83::condition Cond>
void sm83::jp_cc() noexcept
{
    const u16 addr = fetch_16();
    if(check_condition<Cond>()) {
        r_.pc = addr;
        branch_taken_ = true;
    }
}

template<sm83::condition Cond>
void sm83::call_cc() noexcept
{
    const u16 addr = fetch_16();
    if(check_condition<Cond>()) {
        push_16(r_.pc);
        r_.pc = addr;
        branch_taken_ = true;
    }
}

template<sm83::condition Cond>
void sm83::ret_cc() noexcept
{
    if(check_condition<Cond>()) {
        r_.pc = pop_16();
        branch_taken_ = true;
    }
}

template<u8::type Vector>
void sm83::rst() noexcept
{
    push_16(r_.pc);
    r_.pc = u16{Vector};
}

template<sm83::alu_opcode Op, u8::type R>
void sm83::alu_r() noexcept
{
    alu(Op, read_r<R>());
}

template<sm83::alu_opcode Op>
void sm83::alu_d8() noexcept
{
    alu(Op, fetch_8());
}

// P 3 is AF for the stack instructions
template<u8::type P>
void sm83::push_rr() noexcept
{
    if constexpr(P == 3) {
        push_16(r_.af());
    } else {
        push_16(read_rr<P>());
    }
}

template<u8::type P>
void sm83::pop_rr() noexcept
{
    const u16 data = pop_16();
    if constexpr(P == 3) {
        r_.set_af(data);
    } else {
        write_rr<P>(data);
    }
}

template<bool ToA>
void sm83::ldh_a8() noexcept
{
    const u16 addr = 0xFF00_u16 | widen<u16>(fetch_8());
    if constexpr(ToA) {
        r_.a = read_8(addr);
    } else {
        write_8(addr, r_.a);
    }
}

template<bool ToA>
void sm83::ldh_c() noexcept
{
    const u16 addr = 0xFF00_u16 | widen<u16>(r_.c);
    if constexpr(ToA) {
        r_.a = read_8(addr);
    } else {
        write_8(addr, r_.a);
    }
}

template<bool ToA>
void sm83::ld_a16() noexcept
{
    const u16 addr = fetch_16();
    if constexpr(ToA) {
        r_.a = read_8(addr);
    } else {
        write_8(addr, r_.a);
    }
}

template<sm83::shift_opcode Op, u8::type R>
void sm83::shift_r() noexcept
{
    write_r<R>(shift(Op, read_r<R>()));
}

template<u8::type Bit, u8::type R>
void sm83::bit_r() noexcept
{
    r_.f.zero = !read_r<R>().test_bit(u8{Bit});
    r_.f.subtract = false;
    r_.f.half_carry = true;
}

template<u8::type Bit, u8::type R>
void sm83::res_r() noexcept
{
    write_r<R>(bit::clear(read_r<R>(), u8{Bit}));
}

template<u8::type Bit, u8::type R>
void sm83::set_r() noexcept
{
    write_r<R>(bit::set(read_r<R>(), u8{Bit}));
}

} // namespace gbc::cpu

#endif //GAMEBOICOLOR_SM83_ISA_INL
