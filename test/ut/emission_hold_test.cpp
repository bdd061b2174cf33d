// Emission hold tests
#include <boost/ut.hpp>
#include "ydispatch/dispatcher.hpp"
#include "ydispatch/loop.hpp"
#include "ydispatch/manifest.hpp"
#include <optional>
#include <set>
#include <utility>

using namespace boost::ut;
using namespace ydispatch;

namespace {

std::shared_ptr<Dispatcher> make_slider() {
    auto manifest = Manifest::Builder("Slider")
        .event("on_change")
        .property(IntProperty::create("position"))
        .build()
        .value();
    return Dispatcher::create(manifest).value();
}

std::shared_ptr<Dispatcher> make_sender() {
    auto manifest = Manifest::Builder("Sender")
        .events({"on_test", "on_tick"})
        .property(IntProperty::create("value"))
        .property(ListProperty::create("items"))
        .property(DictProperty::create("meta"))
        .build()
        .value();
    return Dispatcher::create(manifest).value();
}

struct Delivery {
    std::string name;
    Value value;
};

Listener record_property(std::vector<Delivery>* log) {
    return Listener("record", [log](const Args& args, const Kwargs& kwargs) {
        auto property = std::any_cast<const PropertyBase*>(kwargs.at("property"));
        log->push_back(Delivery{property->name(), args.at(1)});
    });
}

Task emit_twice_under_hold(Dispatcher* sender, Event* tick, int id) {
    auto hold = co_await sender->emission_lock_async("on_test");
    if (!hold) {
        co_return Err<void>("emit_twice_under_hold: no hold", hold);
    }
    if (auto res = sender->emit("on_test", Args{Value(id), Value(std::string("first"))}); !res) {
        co_return Err<void>("emit_twice_under_hold: first emit", res);
    }
    co_await *tick;
    if (auto res = sender->emit("on_test", Args{Value(id), Value(std::string("second"))}); !res) {
        co_return Err<void>("emit_twice_under_hold: second emit", res);
    }
    co_return Ok();
}

Task try_hold(Dispatcher* sender, std::optional<ErrorCode>* outcome) {
    auto hold = co_await sender->emission_lock_async("on_test");
    *outcome = hold ? ErrorCode::Generic : hold.error().code();
    co_return Ok();
}

Task hold_until_tick(Dispatcher* sender, Event* tick) {
    auto hold = co_await sender->emission_lock_async("on_test");
    co_await *tick;
    co_return Ok();
}

Task hold_properties(Dispatcher* sender) {
    auto value_hold = co_await sender->emission_lock_async("value");
    auto items_hold = co_await sender->emission_lock_async("items");
    auto meta_hold = co_await sender->emission_lock_async("meta");
    if (!value_hold || !items_hold || !meta_hold) {
        co_return Err<void>("hold_properties: hold failed");
    }
    auto items = sender->get_list("items");
    auto meta = sender->get_dict("meta");
    if (!items || !meta) {
        co_return Err<void>("hold_properties: containers missing");
    }
    for (int i = 1; i <= 3; ++i) {
        if (auto res = sender->set("value", i); !res) {
            co_return res;
        }
        (*items)->append(Value(i));
        (*meta)->set("k", Value(i));
    }
    // holds release in reverse order: meta, items, value
    co_return Ok();
}

} // namespace

suite emission_hold_tests = [] {
    "held_emissions_deliver_only_the_last"_test = [] {
        auto slider = make_slider();
        std::vector<int> seen;
        expect(slider->bind("on_change", Listener("record", [&seen](const Args& args, const Kwargs&) {
            seen.push_back(get_as<int>(args.at(0)).value_or(-1));
        })).has_value());

        {
            auto hold_res = slider->emission_lock("on_change");
            expect(hold_res.has_value()) << error_msg(hold_res);
            auto hold = std::move(*hold_res);
            expect(hold.active());

            for (int i = 1; i <= 3; ++i) {
                auto res = slider->emit("on_change", Args{Value(i)});
                expect(res.has_value() && *res == Propagation::Continue);
            }
            expect(seen.empty()) << "Nothing is delivered while held";
        }

        expect(seen == std::vector<int>{3}) << "Only the last emission is delivered";
    };

    "holds_are_reentrant"_test = [] {
        auto slider = make_slider();
        int calls = 0;
        expect(slider->bind("on_change", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        auto outer = std::move(slider->emission_lock("on_change").value());
        {
            auto inner = std::move(slider->emission_lock("on_change").value());
            slider->emit("on_change", Args{Value(1)}).value();
        }
        expect(calls == 0) << "Releasing the inner hold must not deliver";

        slider->emit("on_change", Args{Value(2)}).value();
        outer.release();
        expect(calls == 1);
        expect(!outer.active());

        outer.release();
        expect(calls == 1) << "Releasing twice is a no-op";
    };

    "release_without_emission_delivers_nothing"_test = [] {
        auto slider = make_slider();
        int calls = 0;
        expect(slider->bind("on_change", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        slider->emission_lock("on_change").value().release();
        expect(calls == 0);
        slider->emit("on_change").value();
        expect(calls == 1) << "Emissions flow again after release";
    };

    "property_changes_can_be_held"_test = [] {
        auto slider = make_slider();
        std::vector<std::int64_t> positions;
        expect(slider->bind("position", Listener("record", [&positions](const Args& args, const Kwargs&) {
            positions.push_back(get_as<std::int64_t>(args.at(1)).value_or(-1));
        })).has_value());

        {
            auto hold = std::move(slider->emission_lock("position").value());
            expect(slider->set("position", 5).has_value());
            expect(slider->set("position", 9).has_value());
            expect(slider->get<int>("position").value_or(0) == 9) << "Values still update while held";
        }
        expect(positions == std::vector<std::int64_t>{9});
    };

    "hold_on_unknown_event_fails"_test = [] {
        auto slider = make_slider();
        auto res = slider->emission_lock("on_missing");
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::DoesNotExist);
    };

    "hold_outliving_dispatcher_is_harmless"_test = [] {
        auto slider = make_slider();
        auto hold = std::move(slider->emission_lock("on_change").value());
        slider->emit("on_change").value();
        slider.reset();
        expect(!hold.active());
        hold.release();
    };

    "nested_holds_release_innermost_first"_test = [] {
        auto sender = make_sender();
        std::vector<Delivery> log;
        expect(sender->bind("value", record_property(&log)).has_value());
        expect(sender->bind("items", record_property(&log)).has_value());
        expect(sender->bind("meta", record_property(&log)).has_value());

        {
            auto value_hold = std::move(sender->emission_lock("value").value());
            auto items_hold = std::move(sender->emission_lock("items").value());
            auto meta_hold = std::move(sender->emission_lock("meta").value());
            for (int i = 1; i <= 3; ++i) {
                expect(sender->set("value", i).has_value());
                sender->get_list("items").value()->append(Value(i));
                sender->get_dict("meta").value()->set("k", Value(i));
            }
            expect(log.empty());

            meta_hold.release();
            expect(log.size() == 1_ul && log[0].name == "meta");
        }

        expect(log.size() == 3_ul);
        expect(log[1].name == "items" && log[2].name == "value");
        expect(value_equals(log[0].value, Dict{{"k", Value(3)}}));
        expect(value_equals(log[1].value, List{Value(1), Value(2), Value(3)}));
        expect(get_as<int>(log[2].value).value_or(0) == 3);
    };

    "awaited_nested_holds_release_innermost_first"_test = [] {
        auto sender = make_sender();
        auto loop = Loop::create("holds").value();
        std::vector<Delivery> log;
        expect(sender->bind("value", record_property(&log)).has_value());
        expect(sender->bind("items", record_property(&log)).has_value());
        expect(sender->bind("meta", record_property(&log)).has_value());

        auto res = loop->run_until_complete(hold_properties(sender.get()));
        expect(res.has_value()) << error_msg(res);

        expect(log.size() == 3_ul);
        expect(log[0].name == "meta" && log[1].name == "items" && log[2].name == "value");
        expect(value_equals(log[0].value, Dict{{"k", Value(3)}}));
        expect(value_equals(log[1].value, List{Value(1), Value(2), Value(3)}));
        expect(get_as<int>(log[2].value).value_or(0) == 3);
    };

    "awaited_holds_are_exclusive_between_tasks"_test = [] {
        auto sender = make_sender();
        auto loop = Loop::create("holds").value();
        auto tick = sender->get_dispatcher_event("on_tick").value();

        std::vector<std::pair<int, std::string>> seen;
        expect(sender->bind("on_test", Listener("record", [&seen](const Args& args, const Kwargs&) {
            seen.emplace_back(get_as<int>(args.at(0)).value_or(-1), as_string(args.at(1)).value_or(""));
        })).has_value());

        constexpr int task_count = 8;
        std::vector<TaskHandle> handles;
        for (int i = 0; i < task_count; ++i) {
            handles.push_back(loop->spawn(emit_twice_under_hold(sender.get(), tick, i)));
        }
        loop->run_until_idle();
        expect(seen.empty()) << "First holder is waiting, nothing delivered yet";

        for (int i = 0; i < task_count; ++i) {
            sender->emit("on_tick").value();
            loop->run_until_idle();
        }

        for (const auto& handle : handles) {
            expect(handle.done());
            auto res = handle.result();
            expect(res.has_value()) << error_msg(res);
        }
        expect(seen.size() == static_cast<std::size_t>(task_count)) << "Got " << seen.size();

        std::set<int> ids;
        for (const auto& [id, stage] : seen) {
            expect(stage == "second") << "Held emission of task " << id << " was " << stage;
            ids.insert(id);
        }
        expect(ids.size() == static_cast<std::size_t>(task_count)) << "Every task delivers exactly once";
    };

    "plain_holds_nest_inside_awaited_hold"_test = [] {
        auto sender = make_sender();
        auto loop = Loop::create("holds").value();
        auto tick = sender->get_dispatcher_event("on_tick").value();
        int calls = 0;
        expect(sender->bind("on_test", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        auto handle = loop->spawn(hold_until_tick(sender.get(), tick));
        loop->run_until_idle();
        {
            auto plain = std::move(sender->emission_lock("on_test").value());
            expect(plain.active() && !plain.exclusive());
            sender->emit("on_test").value();
        }
        expect(calls == 0) << "The awaited hold is still in place";

        sender->emit("on_tick").value();
        loop->run_until_idle();
        expect(handle.done());
        expect(calls == 1);
    };

    "waiters_fail_when_dispatcher_goes_away"_test = [] {
        auto sender = make_sender();
        auto loop = Loop::create("holds").value();
        auto tick = sender->get_dispatcher_event("on_tick").value();
        std::optional<ErrorCode> outcome;

        loop->spawn(hold_until_tick(sender.get(), tick));
        auto waiter = loop->spawn(try_hold(sender.get(), &outcome));
        loop->run_until_idle();
        expect(!outcome.has_value()) << "Second task waits for the first";

        sender.reset();
        loop->run_until_idle();
        expect(waiter.done());
        expect(outcome == std::optional<ErrorCode>(ErrorCode::DoesNotExist));
    };

    "awaited_hold_on_unknown_event_fails"_test = [] {
        auto loop = Loop::create("holds").value();
        std::optional<ErrorCode> outcome;
        auto missing = Dispatcher::create(Manifest::Builder("Empty").build().value()).value();
        auto res = loop->run_until_complete(try_hold(missing.get(), &outcome));
        expect(res.has_value());
        expect(outcome == std::optional<ErrorCode>(ErrorCode::DoesNotExist));
    };
};

int main() {
    return 0;
}
