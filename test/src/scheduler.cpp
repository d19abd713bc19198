/*
 * Copyright (C) 2020  emrsmsrli
 *
 * Licensed under GPLv3 or any later version.
 * Refer to the included LICENSE file.
 */

#include <test_prelude.h>

#include <gbc/archive.h>
#include <gbc/core/scheduler.h>

using namespace gbc;

namespace {

struct recorder {
    vector<u32> first_lates;
    vector<u32> second_lates;

    void on_first(const u32 late_cycles) { first_lates.push_back(late_cycles); }
    void on_second(const u32 late_cycles) { second_lates.push_back(late_cycles); }
};

} // namespace

TEST_CASE("scheduler")
{
    scheduler s;
    recorder r;

    SUBCASE("events fire in timestamp order with their lateness") {
        s.add_hw_event(10_u32, {connect_arg<&recorder::on_first>, &r});
        s.add_hw_event(5_u32, {connect_arg<&recorder::on_second>, &r});

        s.add_cycles(8_u32);
        REQUIRE(r.second_lates.size() == 1_usize);
        CHECK(r.second_lates[0_usize] == 3_u32);
        CHECK(r.first_lates.empty());

        s.add_cycles(4_u32);
        REQUIRE(r.first_lates.size() == 1_usize);
        CHECK(r.first_lates[0_usize] == 2_u32);
        CHECK(s.empty());
        CHECK(s.now() == 12_u64);
    }

    SUBCASE("removed events never fire") {
        const scheduler::hw_event::handle h = s.add_hw_event(4_u32, {connect_arg<&recorder::on_first>, &r});
        CHECK(s.has_event(h));
        s.remove_event(h);
        CHECK_FALSE(s.has_event(h));

        s.add_cycles(100_u32);
        CHECK(r.first_lates.empty());
    }

    SUBCASE("pending events survive serialization") {
        s.register_hw_event({connect_arg<&recorder::on_first>, &r}, "recorder::first");
        s.add_cycles(20_u32);
        s.add_hw_event(16_u32, {connect_arg<&recorder::on_first>, &r});

        archive a;
        s.serialize(a);

        recorder r2;
        scheduler restored;
        restored.register_hw_event({connect_arg<&recorder::on_first>, &r2}, "recorder::first");
        restored.deserialize(a);
        REQUIRE_FALSE(a.corrupted());
        CHECK(restored.now() == 20_u64);

        restored.add_cycles(16_u32);
        CHECK(r.first_lates.empty());
        REQUIRE(r2.first_lates.size() == 1_usize);
        CHECK(r2.first_lates[0_usize] == 0_u32);
    }

    SUBCASE("unknown event names corrupt the archive") {
        s.register_hw_event({connect_arg<&recorder::on_second>, &r}, "recorder::second");
        s.add_hw_event(16_u32, {connect_arg<&recorder::on_second>, &r});

        archive a;
        s.serialize(a);

        scheduler other;
        other.deserialize(a);
        CHECK(a.corrupted());
        CHECK(other.empty());
    }
}
