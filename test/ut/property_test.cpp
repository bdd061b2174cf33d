// Property descriptor and value cell tests
#include <boost/ut.hpp>
#include "ydispatch/dispatcher.hpp"
#include "ydispatch/manifest.hpp"
#include "ydispatch/property.hpp"
#include <cctype>
#include <cstdint>
#include <limits>

using namespace boost::ut;
using namespace ydispatch;

namespace {

ManifestPtr make_counter_manifest() {
    return Manifest::Builder("Counter")
        .property(IntProperty::create("value"))
        .build()
        .value();
}

ManifestPtr make_typed_manifest() {
    return Manifest::Builder("Typed")
        .property(StringProperty::create("label", {.default_value = std::string("a"), .allow_none = false}))
        .property(StringProperty::create("note"))
        .property(BoolProperty::create("enabled"))
        .property(IntProperty::create("level", {.min = -10, .max = 10}))
        .property(FloatProperty::create("ratio", {.min = -10.0, .max = 10.0}))
        .property(Property::create("anything"))
        .property(ListProperty::create("items"))
        .build()
        .value();
}

} // namespace

suite property_tests = [] {
    "counter_logs_distinct_values"_test = [] {
        auto counter = Dispatcher::create(make_counter_manifest()).value();
        std::vector<std::int64_t> log;

        auto bind_res = counter->bind("value", Listener("on_value", [&log](const Args& args, const Kwargs&) {
            log.push_back(get_as<std::int64_t>(args[1]).value_or(-1));
        }));
        expect(bind_res.has_value()) << error_msg(bind_res);

        expect(counter->set("value", 1).has_value());
        expect(counter->set("value", 1).has_value());
        expect(counter->set("value", 2).has_value());

        expect(log == std::vector<std::int64_t>{1, 2}) << "Expected log [1, 2], got " << log.size() << " entries";
    };

    "setting_default_is_noop"_test = [] {
        auto counter = Dispatcher::create(make_counter_manifest()).value();
        int calls = 0;
        expect(counter->bind("value", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        expect(counter->set("value", 0).has_value());
        expect(calls == 0) << "Setting the default must not emit";
        expect(counter->set("value", 5).has_value());
        expect(calls == 1);
        expect(counter->get<int>("value").value_or(0) == 5);
    };

    "emission_carries_instance_and_old_value"_test = [] {
        auto counter = Dispatcher::create(make_counter_manifest()).value();
        Dispatcher* seen_instance = nullptr;
        Value seen_old;
        const PropertyBase* seen_property = nullptr;

        expect(counter->bind("value", Listener("inspect", [&](const Args& args, const Kwargs& kwargs) {
            seen_instance = get_as<Dispatcher*>(args[0]).value_or(nullptr);
            seen_old = kwargs.at("old");
            seen_property = get_as<const PropertyBase*>(kwargs.at("property")).value_or(nullptr);
        })).has_value());

        expect(counter->set("value", 3).has_value());
        expect(seen_instance == counter.get());
        expect(get_as<std::int64_t>(seen_old).value_or(-1) == 0);
        expect(seen_property != nullptr && seen_property->name() == "value");
    };

    "values_are_per_instance"_test = [] {
        auto manifest = make_counter_manifest();
        auto first = Dispatcher::create(manifest).value();
        auto second = Dispatcher::create(manifest).value();

        expect(first->set("value", 7).has_value());
        expect(first->get<int>("value").value_or(0) == 7);
        expect(second->get<int>("value").value_or(-1) == 0);
    };

    "list_defaults_are_not_shared"_test = [] {
        auto manifest = make_typed_manifest();
        auto first = Dispatcher::create(manifest).value();
        auto second = Dispatcher::create(manifest).value();

        auto items = first->get_list("items");
        expect(items.has_value()) << error_msg(items);
        (*items)->append(Value(1));

        expect((*first->get_list("items"))->size() == 1_ul);
        expect((*second->get_list("items"))->size() == 0_ul) << "Container default leaked between instances";
    };

    "int_property_rejects_wrong_types"_test = [] {
        auto typed = Dispatcher::create(make_typed_manifest()).value();

        auto float_res = typed->set("level", 1.5);
        expect(!float_res.has_value());
        expect(error_code(float_res) == ErrorCode::InvalidType);
        expect(float_res.error().root_message() == std::string("Type \"float\" not valid"))
            << float_res.error().root_message();

        auto bool_res = typed->set("level", true);
        expect(error_code(bool_res) == ErrorCode::InvalidType);

        auto huge_res = typed->set("level", std::numeric_limits<std::uint64_t>::max());
        expect(error_code(huge_res) == ErrorCode::OutOfRange) << "Oversized unsigned must not wrap";
        expect(typed->set("level", std::uint64_t{7}).has_value());
        expect(typed->get<int>("level").value_or(0) == 7);

        auto none_res = typed->set("level", nullptr);
        expect(error_code(none_res) == ErrorCode::NoneNotAllowed);
        expect(none_res.error().root_message() == std::string("\"None\" not allowed"));
    };

    "int_property_range"_test = [] {
        auto typed = Dispatcher::create(make_typed_manifest()).value();
        int calls = 0;
        expect(typed->bind("level", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        auto res = typed->set("level", -11);
        expect(!res.has_value());
        expect(error_code(res) == ErrorCode::OutOfRange);
        expect(res.error().root_message() == std::string("Value -11 must be in range \"-10 <= value <= 10\""))
            << res.error().root_message();
        expect(is_validation_error(error_code(res)));
        expect(calls == 0) << "Rejected value must not emit";
        expect(typed->get<int>("level").value_or(99) == 0) << "Rejected value must not be stored";

        expect(typed->set("level", 10).has_value());
        expect(calls == 1);
    };

    "float_property_accepts_integers"_test = [] {
        auto typed = Dispatcher::create(make_typed_manifest()).value();

        expect(typed->set("ratio", 3).has_value());
        auto value = typed->get_property("ratio");
        expect(std::any_cast<double>(&*value) != nullptr) << "FloatProperty stores double";
        expect(typed->get<double>("ratio").value_or(0.0) == 3.0);

        auto res = typed->set("ratio", -11);
        expect(error_code(res) == ErrorCode::OutOfRange);
        expect(res.error().root_message() == std::string("Value -11.0 must be in range \"-10 <= value <= 10\""))
            << res.error().root_message();

        expect(error_code(typed->set("ratio", false)) == ErrorCode::InvalidType);
    };

    "string_and_bool_properties"_test = [] {
        auto typed = Dispatcher::create(make_typed_manifest()).value();

        expect(typed->set("label", "hello").has_value());
        expect(typed->get<std::string>("label").value_or("") == std::string("hello"));
        expect(error_code(typed->set("label", nullptr)) == ErrorCode::NoneNotAllowed);
        expect(error_code(typed->set("label", 5)) == ErrorCode::InvalidType);

        expect(typed->set("note", nullptr).has_value()) << "StringProperty allows None by default";

        expect(typed->set("enabled", true).has_value());
        expect(typed->get<bool>("enabled").value_or(false));
        auto res = typed->set("enabled", 1);
        expect(error_code(res) == ErrorCode::InvalidType);
        expect(res.error().root_message() == std::string("Type \"int\" not valid"));
    };

    "untyped_property_accepts_anything"_test = [] {
        auto typed = Dispatcher::create(make_typed_manifest()).value();
        expect(typed->set("anything", 1).has_value());
        expect(typed->set("anything", "text").has_value());
        expect(typed->set("anything", nullptr).has_value());
    };

    "pointer_values_compare_by_address"_test = [] {
        auto typed = Dispatcher::create(make_typed_manifest()).value();
        auto other = Dispatcher::create(make_counter_manifest()).value();
        auto third = Dispatcher::create(make_counter_manifest()).value();
        int calls = 0;
        expect(typed->bind("anything", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        expect(typed->set_property("anything", Value(other.get())).has_value());
        expect(typed->set_property("anything", Value(other.get())).has_value());
        expect(calls == 1) << "Same pointer again is not a change";

        expect(typed->set_property("anything", Value(third.get())).has_value());
        expect(calls == 2);

        int cell = 0;
        expect(typed->set_property("anything", Value(static_cast<void*>(&cell))).has_value());
        expect(typed->set_property("anything", Value(static_cast<void*>(&cell))).has_value());
        expect(calls == 3);
    };

    "custom_validator_and_comparator"_test = [] {
        PropertyOptions options;
        options.default_value = std::string("");
        options.validator = [](const Value& v) -> Result<void> {
            if (as_string(v).value_or("").size() > 3) {
                return Err<void>("too long");
            }
            return Ok();
        };
        // case-insensitive comparison
        options.comparator = [](const Value& a, const Value& b) {
            auto lower = [](std::string s) {
                for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                return s;
            };
            return lower(as_string(a).value_or("")) == lower(as_string(b).value_or(""));
        };
        auto manifest = Manifest::Builder("Coded").property(Property::create("code", options)).build().value();
        auto coded = Dispatcher::create(manifest).value();
        int calls = 0;
        expect(coded->bind("code", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        auto long_res = coded->set("code", "abcd");
        expect(error_code(long_res) == ErrorCode::Validation);
        expect(long_res.error().root_message() == std::string("too long"));

        expect(coded->set("code", "abc").has_value());
        expect(coded->set("code", "ABC").has_value());
        expect(calls == 1) << "Comparator treats ABC as unchanged";
    };

    "invalid_declarations_fail_at_create"_test = [] {
        auto bad_range = IntProperty::create("n", {.min = 5, .max = 1});
        expect(!bad_range.has_value());

        auto bad_default = IntProperty::create("n", {.default_value = std::int64_t{20}, .max = 10});
        expect(!bad_default.has_value());
        expect(error_code(bad_default) == ErrorCode::OutOfRange);
    };

    "property_ref_get_set"_test = [] {
        auto counter = Dispatcher::create(make_counter_manifest()).value();
        int calls = 0;
        expect(counter->bind("value", Listener("count", [&calls](const Args&, const Kwargs&) {
            ++calls;
        })).has_value());

        auto ref = counter->property<std::int64_t>("value");
        expect(ref.has_value()) << error_msg(ref);
        expect(ref->get().value_or(-1) == 0);
        expect(ref->set(4).has_value());
        expect(ref->get().value_or(-1) == 4);
        expect(ref->set(4).has_value());
        expect(calls == 1);

        auto missing = counter->property<int>("missing");
        expect(error_code(missing) == ErrorCode::DoesNotExist);
    };

    "unknown_property_fails"_test = [] {
        auto counter = Dispatcher::create(make_counter_manifest()).value();
        expect(error_code(counter->get_property("nope")) == ErrorCode::DoesNotExist);
        expect(error_code(counter->set("nope", 1)) == ErrorCode::DoesNotExist);
    };
};

int main() {
    return 0;
}
