// Event registry and dispatch tests
#include <boost/ut.hpp>
#include "ydispatch/dispatcher.hpp"
#include "ydispatch/manifest.hpp"
#include "ydispatch/types.hpp"
#include <algorithm>

using namespace boost::ut;
using namespace ydispatch;

namespace {

ManifestPtr make_button_manifest() {
    return Manifest::Builder("Button")
        .events({"on_press", "on_release"})
        .property(IntProperty::create("clicks"))
        .build()
        .value();
}

std::shared_ptr<Dispatcher> make_button() {
    return Dispatcher::create(make_button_manifest()).value();
}

int g_press_calls = 0;
Args g_press_args;

void on_press(const Args& args, const Kwargs&) {
    ++g_press_calls;
    g_press_args = args;
}

class Recorder {
public:
    void on_event(const Args& args, const Kwargs&) {
        calls.push_back(args.empty() ? std::string("?") : as_string(args[0]).value_or("?"));
    }
    Propagation on_stop(const Args&, const Kwargs&) {
        calls.push_back("stop");
        return Propagation::Stop;
    }

    std::vector<std::string> calls;
};

} // namespace

suite event_tests = [] {
    "bind_then_emit_invokes_once"_test = [] {
        auto button = make_button();
        g_press_calls = 0;

        auto bind_res = button->bind("on_press", &on_press);
        expect(bind_res.has_value()) << "bind failed: " << error_msg(bind_res);

        auto emit_res = button->emit("on_press", Args{Value(std::string("left")), Value(2)});
        expect(emit_res.has_value()) << "emit failed: " << error_msg(emit_res);
        expect(g_press_calls == 1) << "Expected 1 call, got " << g_press_calls;
        expect(g_press_args.size() == 2_ul);
        expect(as_string(g_press_args[0]).value_or("") == std::string("left"));
        expect(get_as<int>(g_press_args[1]).value_or(0) == 2);
    };

    "second_identical_bind_is_noop"_test = [] {
        auto button = make_button();
        g_press_calls = 0;

        expect(button->bind("on_press", &on_press).has_value());
        expect(button->bind("on_press", &on_press).has_value());

        auto event = button->get_dispatcher_event("on_press");
        expect(event.has_value());
        expect((*event)->listener_count() == 1_ul) << "Duplicate bind must not add an entry";

        button->emit("on_press").value();
        expect(g_press_calls == 1) << "Expected 1 call, got " << g_press_calls;
    };

    "listeners_run_in_bind_order_and_stop_halts"_test = [] {
        auto button = make_button();
        std::vector<int> order;

        expect(button->bind("on_press", Listener("f1", [&order](const Args&, const Kwargs&) {
            order.push_back(1);
        })).has_value());
        expect(button->bind("on_press", Listener("f2", [&order](const Args&, const Kwargs&) {
            order.push_back(2);
            return Propagation::Stop;
        })).has_value());
        expect(button->bind("on_press", Listener("f3", [&order](const Args&, const Kwargs&) {
            order.push_back(3);
        })).has_value());

        auto res = button->emit("on_press");
        expect(res.has_value());
        expect(*res == Propagation::Stop) << "emit must report the stop";
        expect(order == std::vector<int>{1, 2}) << "f3 must not be invoked after a stop";
    };

    "non_propagation_return_values_are_ignored"_test = [] {
        auto button = make_button();
        int calls = 0;
        expect(button->bind("on_press", Listener("returns_int", [&calls](const Args&, const Kwargs&) {
            ++calls;
            return 42;
        })).has_value());
        expect(button->bind("on_press", Listener("after", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        auto res = button->emit("on_press");
        expect(res.has_value() && *res == Propagation::Continue);
        expect(calls == 2);
    };

    "kwargs_pass_through"_test = [] {
        auto button = make_button();
        Kwargs seen;
        expect(button->bind("on_release", Listener("kw", [&seen](const Args&, const Kwargs& kwargs) {
            seen = kwargs;
        })).has_value());

        button->emit("on_release", {}, Kwargs{{"x", Value(10)}, {"y", Value(20)}}).value();
        expect(seen.size() == 2_ul);
        expect(get_as<int>(seen["x"]).value_or(0) == 10);
        expect(get_as<int>(seen["y"]).value_or(0) == 20);
    };

    "unknown_event_fails"_test = [] {
        auto button = make_button();

        auto emit_res = button->emit("on_hover");
        expect(!emit_res.has_value());
        expect(error_code(emit_res) == ErrorCode::DoesNotExist);

        auto bind_res = button->bind("on_hover", &on_press);
        expect(!bind_res.has_value());
        expect(error_code(bind_res) == ErrorCode::DoesNotExist);

        auto event_res = button->get_dispatcher_event("on_hover");
        expect(!event_res.has_value());
        expect(error_code(event_res) == ErrorCode::DoesNotExist);
    };

    "multi_bind_is_all_or_nothing"_test = [] {
        auto button = make_button();
        g_press_calls = 0;

        Bindings bindings;
        bindings.emplace_back("on_press", Listener(&on_press));
        bindings.emplace_back("on_hover", Listener(&on_press));
        auto res = button->bind(bindings);
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::DoesNotExist);

        button->emit("on_press").value();
        expect(g_press_calls == 0) << "No listener may be bound after a failed multi-bind";
    };

    "emitting_with_no_listeners_is_legal"_test = [] {
        auto button = make_button();
        auto res = button->emit("on_release");
        expect(res.has_value() && *res == Propagation::Continue);
    };

    "dead_owner_is_skipped_and_pruned"_test = [] {
        auto button = make_button();
        auto recorder = std::make_shared<Recorder>();

        expect(button->bind("on_press", Listener(recorder, &Recorder::on_event)).has_value());
        button->emit("on_press", Args{Value(std::string("a"))}).value();
        expect(recorder->calls.size() == 1_ul);

        recorder.reset();

        auto res = button->emit("on_press", Args{Value(std::string("b"))});
        expect(res.has_value()) << "Emitting after the owner died must not fail";
        auto event = button->get_dispatcher_event("on_press");
        expect((*event)->listener_count() == 0_ul) << "Dead entry should be pruned";
    };

    "tagged_callable_follows_owner_lifetime"_test = [] {
        auto button = make_button();
        auto owner = std::make_shared<int>(0);
        int calls = 0;

        expect(button->bind("on_press", Listener(owner, "counter", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());
        button->emit("on_press").value();
        owner.reset();
        button->emit("on_press").value();
        expect(calls == 1) << "Callable must not run once its owner is gone";
    };

    "unbind_removes_matching_entries"_test = [] {
        auto button = make_button();
        g_press_calls = 0;

        expect(button->bind("on_press", &on_press).has_value());
        expect(button->bind("on_release", &on_press).has_value());
        button->unbind(Listener(&on_press));

        button->emit("on_press").value();
        button->emit("on_release").value();
        expect(g_press_calls == 0);

        // Unbinding again is a no-op
        button->unbind(Listener(&on_press));
    };

    "unbind_owner_removes_all_of_its_entries"_test = [] {
        auto button = make_button();
        auto recorder = std::make_shared<Recorder>();
        auto other = std::make_shared<Recorder>();

        expect(button->bind("on_press", Listener(recorder, &Recorder::on_event)).has_value());
        expect(button->bind("on_release", Listener(recorder, &Recorder::on_stop)).has_value());
        expect(button->bind("on_press", Listener(other, &Recorder::on_event)).has_value());

        button->unbind_owner(recorder);

        button->emit("on_press", Args{Value(std::string("p"))}).value();
        button->emit("on_release").value();
        expect(recorder->calls.empty()) << "Owner entries must all be removed";
        expect(other->calls.size() == 1_ul);
    };

    "listener_bound_during_emit_waits_for_next_emit"_test = [] {
        auto button = make_button();
        Dispatcher* raw = button.get();
        int late_calls = 0;

        expect(button->bind("on_press", Listener("binder", [raw, &late_calls](const Args&, const Kwargs&) {
            auto res = raw->bind("on_press", Listener("late", [&late_calls](const Args&, const Kwargs&) {
                ++late_calls;
            }));
            (void)res;
        })).has_value());

        button->emit("on_press").value();
        expect(late_calls == 0) << "Listener bound during emission must not see it";
        button->emit("on_press").value();
        expect(late_calls == 1);
    };

    "register_event_is_idempotent_and_all_or_nothing"_test = [] {
        auto button = make_button();

        expect(button->register_event("on_hover").has_value());
        expect(button->register_event("on_hover").has_value());
        expect(button->has_event("on_hover"));

        auto res = button->register_events({"on_focus", "clicks"});
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::PropertyExists);
        expect(!button->has_event("on_focus")) << "Failed registration must add nothing";

        auto names = button->event_names();
        expect(std::find(names.begin(), names.end(), "clicks") != names.end())
            << "Property names count as events";
    };

    "events_are_per_instance"_test = [] {
        auto first = make_button();
        auto second = make_button();
        g_press_calls = 0;

        expect(first->bind("on_press", &on_press).has_value());
        second->emit("on_press").value();
        expect(g_press_calls == 0);
        first->emit("on_press").value();
        expect(g_press_calls == 1);
    };
};

int main() {
    return 0;
}
