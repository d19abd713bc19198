/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#ifndef GAMEBOICOLOR_SM83_DECODER_TABLE_GEN_H
#define GAMEBOICOLOR_SM83_DECODER_TABLE_GEN_H

#include <type_traits>

#include <gbc/core/container.h>
#include <gbc/cpu/sm83.h>
#include <gbc/helper/function_ptr.h>
#include <gbc/helper/static_for.h>

namespace gbc::cpu {

/*
 * Opcodes are split into fields as
 *   x = bits 7-6, y = bits 5-3, z = bits 2-0, p = bits 5-4, q = bit 3
 * and decoded once at compile time into member function pointer tables.
 */
class decoder_table_generator {
public:
    static constexpr usize::type max_decoders = 256;

    using decoder = function_ptr<sm83, void()>;
    template<typename T> using decoder_func = typename T::type;

    using decoder_table = array<decoder, max_decoders>;
    using info_table = array<instruction_info, max_decoders>;

private:
    using condition = sm83::condition;
    using alu_opcode = sm83::alu_opcode;
    using shift_opcode = sm83::shift_opcode;

    template<auto Opcode>
    static constexpr decoder_func<decoder> generate() noexcept
    {
        constexpr u8 opcode = narrow<u8>(u32{Opcode});
        constexpr u8 x = opcode >> 6_u8;
        constexpr u8 y = (opcode >> 3_u8) & 0b111_u8;
        constexpr u8 z = opcode & 0b111_u8;
        constexpr u8 p = y >> 1_u8;
        constexpr bool q = y.test_bit(0_u8);

        if constexpr(x == 0_u8) {
            if constexpr(z == 0_u8) {
                if constexpr(y == 0_u8) { return &sm83::nop; }
                else if constexpr(y == 1_u8) { return &sm83::ld_a16_sp; }
                else if constexpr(y == 2_u8) { return &sm83::stop; }
                else if constexpr(y == 3_u8) { return &sm83::jr; }
                else { return &sm83::jr_cc<to_enum<condition>(y - 4_u8)>; }
            }

            if constexpr(z == 1_u8) {
                if constexpr(q) { return &sm83::add_hl_rr<p.get()>; }
                return &sm83::ld_rr_d16<p.get()>;
            }

            if constexpr(z == 2_u8) { return &sm83::ld_indirect<p.get(), q>; }
            if constexpr(z == 3_u8) { return &sm83::inc_dec_rr<p.get(), q>; }
            if constexpr(z == 4_u8) { return &sm83::inc_r<y.get()>; }
            if constexpr(z == 5_u8) { return &sm83::dec_r<y.get()>; }
            if constexpr(z == 6_u8) { return &sm83::ld_r_d8<y.get()>; }

            if constexpr(y < 4_u8) { return &sm83::rotate_a<to_enum<shift_opcode>(y)>; }
            if constexpr(y == 4_u8) { return &sm83::daa; }
            if constexpr(y == 5_u8) { return &sm83::cpl; }
            if constexpr(y == 6_u8) { return &sm83::scf; }
            return &sm83::ccf;
        }

        if constexpr(x == 1_u8) {
            if constexpr(y == 6_u8 && z == 6_u8) { return &sm83::halt; }
            return &sm83::ld_r_r<y.get(), z.get()>;
        }

        if constexpr(x == 2_u8) {
            return &sm83::alu_r<to_enum<alu_opcode>(y), z.get()>;
        }

        if constexpr(z == 0_u8) {
            if constexpr(y < 4_u8) { return &sm83::ret_cc<to_enum<condition>(y)>; }
            if constexpr(y == 4_u8) { return &sm83::ldh_a8<false>; }
            if constexpr(y == 5_u8) { return &sm83::add_sp_r8; }
            if constexpr(y == 6_u8) { return &sm83::ldh_a8<true>; }
            return &sm83::ld_hl_sp_r8;
        }

        if constexpr(z == 1_u8) {
            if constexpr(!q) { return &sm83::pop_rr<p.get()>; }
            if constexpr(p == 0_u8) { return &sm83::ret; }
            if constexpr(p == 1_u8) { return &sm83::reti; }
            if constexpr(p == 2_u8) { return &sm83::jp_hl; }
            return &sm83::ld_sp_hl;
        }

        if constexpr(z == 2_u8) {
            if constexpr(y < 4_u8) { return &sm83::jp_cc<to_enum<condition>(y)>; }
            if constexpr(y == 4_u8) { return &sm83::ldh_c<false>; }
            if constexpr(y == 5_u8) { return &sm83::ld_a16<false>; }
            if constexpr(y == 6_u8) { return &sm83::ldh_c<true>; }
            return &sm83::ld_a16<true>;
        }

        if constexpr(z == 3_u8) {
            if constexpr(y == 0_u8) { return &sm83::jp; }
            if constexpr(y == 1_u8) { return &sm83::prefix_cb; }
            if constexpr(y == 6_u8) { return &sm83::di; }
            if constexpr(y == 7_u8) { return &sm83::ei; }
            return &sm83::undefined;
        }

        if constexpr(z == 4_u8) {
            if constexpr(y < 4_u8) { return &sm83::call_cc<to_enum<condition>(y)>; }
            return &sm83::undefined;
        }

        if constexpr(z == 5_u8) {
            if constexpr(!q) { return &sm83::push_rr<p.get()>; }
            if constexpr(p == 0_u8) { return &sm83::call; }
            return &sm83::undefined;
        }

        if constexpr(z == 6_u8) {
            return &sm83::alu_d8<to_enum<alu_opcode>(y)>;
        }

        return &sm83::rst<(y * 8_u8).get()>;
    }

    template<auto Opcode>
    static constexpr decoder_func<decoder> generate_prefixed() noexcept
    {
        constexpr u8 opcode = narrow<u8>(u32{Opcode});
        constexpr u8 x = opcode >> 6_u8;
        constexpr u8 y = (opcode >> 3_u8) & 0b111_u8;
        constexpr u8 z = opcode & 0b111_u8;

        if constexpr(x == 0_u8) { return &sm83::shift_r<to_enum<shift_opcode>(y), z.get()>; }
        if constexpr(x == 1_u8) { return &sm83::bit_r<y.get(), z.get()>; }
        if constexpr(x == 2_u8) { return &sm83::res_r<y.get(), z.get()>; }
        return &sm83::set_r<y.get(), z.get()>;
    }

    static constexpr instruction_info make_info(const u8 length, const u8 cycles, const u8 cycles_taken) noexcept
    {
        return instruction_info{length, cycles, cycles_taken};
    }

    static constexpr instruction_info make_info(const u8 length, const u8 cycles) noexcept
    {
        return make_info(length, cycles, cycles);
    }

    static constexpr instruction_info generate_info(const u8 opcode) noexcept
    {
        const u8 x = opcode >> 6_u8;
        const u8 y = (opcode >> 3_u8) & 0b111_u8;
        const u8 z = opcode & 0b111_u8;
        const u8 p = y >> 1_u8;
        const bool q = y.test_bit(0_u8);

        switch(x.get()) {
            case 0:
                switch(z.get()) {
                    case 0:
                        if(y == 0_u8) { return make_info(1_u8, 4_u8); }
                        if(y == 1_u8) { return make_info(3_u8, 20_u8); }
                        if(y == 2_u8) { return make_info(2_u8, 4_u8); }
                        if(y == 3_u8) { return make_info(2_u8, 12_u8); }
                        return make_info(2_u8, 8_u8, 12_u8);
                    case 1:  return q ? make_info(1_u8, 8_u8) : make_info(3_u8, 12_u8);
                    case 2:
                    case 3:  return make_info(1_u8, 8_u8);
                    case 4:
                    case 5:  return y == 6_u8 ? make_info(1_u8, 12_u8) : make_info(1_u8, 4_u8);
                    case 6:  return y == 6_u8 ? make_info(2_u8, 12_u8) : make_info(2_u8, 8_u8);
                    default: return make_info(1_u8, 4_u8);
                }
            case 1:
                if(y == 6_u8 && z == 6_u8) { return make_info(1_u8, 4_u8); }
                return y == 6_u8 || z == 6_u8 ? make_info(1_u8, 8_u8) : make_info(1_u8, 4_u8);
            case 2:
                return z == 6_u8 ? make_info(1_u8, 8_u8) : make_info(1_u8, 4_u8);
            default:
                break;
        }

        switch(z.get()) {
            case 0:
                if(y < 4_u8) { return make_info(1_u8, 8_u8, 20_u8); }
                if(y == 5_u8) { return make_info(2_u8, 16_u8); }
                return make_info(2_u8, 12_u8);
            case 1:
                if(!q) { return make_info(1_u8, 12_u8); }
                if(p < 2_u8) { return make_info(1_u8, 16_u8); }
                return p == 2_u8 ? make_info(1_u8, 4_u8) : make_info(1_u8, 8_u8);
            case 2:
                if(y < 4_u8) { return make_info(3_u8, 12_u8, 16_u8); }
                return y == 4_u8 || y == 6_u8 ? make_info(1_u8, 8_u8) : make_info(3_u8, 16_u8);
            case 3:
                if(y == 0_u8) { return make_info(3_u8, 16_u8); }
                if(y == 1_u8) { return make_info(2_u8, 8_u8); }  // resolved through the prefixed table
                return make_info(1_u8, 4_u8);
            case 4:
                return y < 4_u8 ? make_info(3_u8, 12_u8, 24_u8) : make_info(1_u8, 4_u8);
            case 5:
                if(!q) { return make_info(1_u8, 16_u8); }
                return p == 0_u8 ? make_info(3_u8, 24_u8) : make_info(1_u8, 4_u8);
            case 6:
                return make_info(2_u8, 8_u8);
            default:
                return make_info(1_u8, 16_u8);
        }
    }

    static constexpr instruction_info generate_prefixed_info(const u8 opcode) noexcept
    {
        if((opcode & 0b111_u8) != 6_u8) {
            return make_info(2_u8, 8_u8);
        }

        // BIT only reads (HL)
        return (opcode >> 6_u8) == 1_u8 ? make_info(2_u8, 12_u8) : make_info(2_u8, 16_u8);
    }

public:
    static constexpr decoder_table generate_table() noexcept
    {
        decoder_table table;
        static_for<u32::type, 0, max_decoders>([&](const auto opcode) {
            table[static_cast<u32::type>(opcode)] = decoder{generate<std::decay_t<decltype(opcode)>::value>()};
        });
        return table;
    }

    static constexpr decoder_table generate_prefixed_table() noexcept
    {
        decoder_table table;
        static_for<u32::type, 0, max_decoders>([&](const auto opcode) {
            table[static_cast<u32::type>(opcode)] = decoder{generate_prefixed<std::decay_t<decltype(opcode)>::value>()};
        });
        return table;
    }

    static constexpr info_table generate_info_table() noexcept
    {
        info_table table{};
        for(u32::type opcode = 0; opcode < max_decoders; ++opcode) {
            table[opcode] = generate_info(narrow<u8>(u32{opcode}));
        }
        return table;
    }

    static constexpr info_table generate_prefixed_info_table() noexcept
    {
        info_table table{};
        for(u32::type opcode = 0; opcode < max_decoders; ++opcode) {
            table[opcode] = generate_prefixed_info(narrow<u8>(u32{opcode}));
        }
        return table;
    }
};

} // namespace gbc::cpu

#endif //GAMEBOICOLOR_SM83_DECODER_TABLE_GEN_H
