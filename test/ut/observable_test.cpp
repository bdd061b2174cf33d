// Observable container tests
#include <boost/ut.hpp>
#include "ydispatch/dispatcher.hpp"
#include "ydispatch/manifest.hpp"
#include "ydispatch/observable.hpp"

using namespace boost::ut;
using namespace ydispatch;

namespace {

ManifestPtr make_store_manifest() {
    return Manifest::Builder("Store")
        .property(ListProperty::create("items"))
        .property(DictProperty::create("meta", {.default_value = Dict{{"name", Value(std::string("store"))}}}))
        .build()
        .value();
}

// Records every emission of one property as a raw deep copy
struct Emissions {
    std::vector<Value> values;

    Listener listener() {
        return Listener("record", [this](const Args& args, const Kwargs&) {
            if (auto list = get_as<ObservableListPtr>(args[1])) {
                values.push_back((*list)->to_list());
            } else if (auto dict = get_as<ObservableDictPtr>(args[1])) {
                values.push_back((*dict)->to_dict());
            } else {
                values.push_back(args[1]);
            }
        });
    }
};

} // namespace

suite observable_tests = [] {
    "append_fires_one_event_with_whole_list"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("items", emissions.listener()).has_value());

        auto items = store->get_list("items").value();
        items->append(Value(std::string("x")));

        expect(emissions.values.size() == 1_ul);
        expect(value_equals(emissions.values[0], List{Value(std::string("x"))}))
            << "Got " << value_to_string(emissions.values[0]);
    };

    "nested_dict_mutation_fires_once_with_full_structure"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("items", emissions.listener()).has_value());

        auto items = store->get_list("items").value();
        items->append(Value(std::string("x")));
        items->append(Dict{{"k", Value(1)}});
        expect(emissions.values.size() == 2_ul);

        auto nested = items->dict_at(1);
        expect(nested != nullptr) << "Nested dict should be wrapped";
        nested->set("k", Value(2));

        expect(emissions.values.size() == 3_ul) << "Nested mutation must emit exactly once";
        List expected{Value(std::string("x")), Value(Dict{{"k", Value(2)}})};
        expect(value_equals(emissions.values[2], expected)) << "Got " << value_to_string(emissions.values[2]);
    };

    "deeply_nested_mutation_reaches_root"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("meta", emissions.listener()).has_value());

        auto meta = store->get_dict("meta").value();
        meta->set("tags", List{Value(List{})});
        meta->list_at("tags")->list_at(0)->append(Value(std::string("deep")));

        expect(emissions.values.size() == 2_ul);
        Dict expected{{"name", Value(std::string("store"))},
                      {"tags", Value(List{Value(List{Value(std::string("deep"))})})}};
        expect(value_equals(emissions.values[1], expected)) << "Got " << value_to_string(emissions.values[1]);
    };

    "bulk_operations_emit_once"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions list_emissions;
        Emissions dict_emissions;
        expect(store->bind("items", list_emissions.listener()).has_value());
        expect(store->bind("meta", dict_emissions.listener()).has_value());

        auto items = store->get_list("items").value();
        items->extend(List{Value(1), Value(2), Value(3)});
        items->clear();
        expect(list_emissions.values.size() == 2_ul);

        auto meta = store->get_dict("meta").value();
        meta->update(Dict{{"a", Value(1)}, {"b", Value(2)}});
        expect(dict_emissions.values.size() == 1_ul);
        expect(meta->size() == 3_ul);
    };

    "list_mutators"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        auto items = store->get_list("items").value();

        items->extend(List{Value(1), Value(2), Value(3)});
        expect(items->set(0, Value(10)).has_value());
        items->insert(1, Value(15));
        items->insert(100, Value(99));
        expect(items->remove(Value(2)).has_value());
        expect(items->erase(-1).has_value());

        expect(value_equals(items->to_list(), List{Value(10), Value(15), Value(3)}))
            << value_to_string(items->to_list());

        auto popped = items->pop();
        expect(popped.has_value());
        expect(get_as<int>(*popped).value_or(0) == 3);
        expect(get_as<int>(items->at(-1).value()).value_or(0) == 15);
    };

    "dict_mutators"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("meta", emissions.listener()).has_value());
        auto meta = store->get_dict("meta").value();

        meta->set("a", Value(1));
        auto existing = meta->setdefault("a", Value(5));
        expect(get_as<int>(existing).value_or(0) == 1);
        auto added = meta->setdefault("b", Value(7));
        expect(get_as<int>(added).value_or(0) == 7);

        auto popped = meta->pop("a");
        expect(get_as<int>(popped.value()).value_or(0) == 1);
        expect(meta->erase("b").has_value());
        expect(meta->keys() == std::vector<std::string>{"name"});
        expect(emissions.values.size() == 5_ul) << "Got " << emissions.values.size();
    };

    "failing_mutators_do_not_emit"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("items", emissions.listener()).has_value());
        expect(store->bind("meta", emissions.listener()).has_value());
        auto items = store->get_list("items").value();
        auto meta = store->get_dict("meta").value();

        expect(error_code(items->pop()) == ErrorCode::IndexError);
        expect(error_code(items->set(3, Value(1))) == ErrorCode::IndexError);
        expect(error_code(items->erase(0)) == ErrorCode::IndexError);
        expect(error_code(items->remove(Value(1))) == ErrorCode::ValueNotFound);
        expect(error_code(meta->erase("missing")) == ErrorCode::KeyError);
        expect(error_code(meta->pop("missing")) == ErrorCode::KeyError);
        expect(error_code(meta->get("missing")) == ErrorCode::KeyError);

        expect(emissions.values.empty()) << "Failed mutations must not emit";
    };

    "removed_values_stop_propagating"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("items", emissions.listener()).has_value());
        auto items = store->get_list("items").value();

        items->append(Dict{{"k", Value(1)}});
        auto nested = items->dict_at(0);
        expect(items->erase(0).has_value());
        expect(emissions.values.size() == 2_ul);

        nested->set("k", Value(2));
        expect(emissions.values.size() == 2_ul) << "Detached child must not emit";
        expect(!nested->attached());
    };

    "reassignment_is_equality_gated"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("items", emissions.listener()).has_value());

        auto old_items = store->get_list("items").value();
        old_items->append(Value(1));
        expect(emissions.values.size() == 1_ul);

        expect(store->set_property("items", List{Value(1)}).has_value());
        expect(emissions.values.size() == 1_ul) << "Structurally equal list must not emit";

        expect(store->set_property("items", List{Value(1), Value(2)}).has_value());
        expect(emissions.values.size() == 2_ul);

        old_items->append(Value(3));
        expect(emissions.values.size() == 2_ul) << "Replaced container must not emit";
        expect(store->get_list("items").value()->size() == 2_ul);

        auto none_res = store->set_property("items", Value());
        expect(!none_res.has_value()) << "List properties reject None";
    };

    "containers_outliving_dispatcher_do_not_emit"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        auto items = store->get_list("items").value();
        expect(items->attached());

        store.reset();
        expect(!items->attached());
        items->append(Value(1));
        expect(items->size() == 1_ul);
    };

    "standalone_containers_are_plain"_test = [] {
        auto list = ObservableList::create(List{Value(1), Value(List{Value(2)})});
        expect(!list->attached());
        expect(list->list_at(1) != nullptr);
        list->list_at(1)->append(Value(3));
        expect(value_equals(list->to_list(), List{Value(1), Value(List{Value(2), Value(3)})}));

        auto dict = ObservableDict::create();
        dict->set("x", Value(1));
        expect(dict->contains("x"));
        expect(get_as<int>(dict->get("y", Value(9))).value_or(0) == 9);
    };

    "assigning_an_element_to_itself_keeps_it"_test = [] {
        auto store = Dispatcher::create(make_store_manifest()).value();
        Emissions emissions;
        expect(store->bind("items", emissions.listener()).has_value());

        auto items = store->get_list("items").value();
        items->append(Value(std::string("x")));
        items->append(Value(List{Value(1)}));
        expect(items->set(0, items->items()[0]).has_value());
        expect(items->set(1, items->items()[1]).has_value());
        expect(value_equals(items->to_list(), List{Value(std::string("x")), Value(List{Value(1)})}))
            << "Got " << value_to_string(items->to_list());
        expect(value_equals(emissions.values.back(), items->to_list()));

        items->list_at(1)->append(Value(2));
        expect(emissions.values.size() == 5_ul) << "Reassigned nested list still reports";

        items->extend(items->items());
        expect(items->size() == 4_ul);

        auto meta = store->get_dict("meta").value();
        meta->set("name", meta->items().at("name"));
        meta->update(meta->items());
        expect(as_string(meta->get("name", Value())).value_or("") == std::string("store"));
    };
};

int main() {
    return 0;
}
