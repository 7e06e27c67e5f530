#include "helpers/HelperArguments.h"
#include "helpers/HelperLibrary.h"
#include <algorithm>
#include <vector>

namespace SBX {

using namespace HelperArguments;

namespace {

bool isPrimitive(const HostValue &value) {
    return !value.is_array() && !value.is_object();
}

// Set semantics: primitives compare by value, every object or array is distinct
HostValue unique(const HelperArgs &args) {
    const HostValue &items = requireArray(args, 0, "array.unique");
    HostValue result = HostValue::array();
    for (const auto &item : items) {
        bool seen = false;
        if (isPrimitive(item)) {
            seen = std::any_of(result.begin(), result.end(),
                               [&item](const HostValue &existing) { return isPrimitive(existing) && existing == item; });
        }
        if (!seen) {
            result.push_back(item);
        }
    }
    return result;
}

void flattenInto(const HostValue &items, HostValue &out) {
    for (const auto &item : items) {
        if (item.is_array()) {
            flattenInto(item, out);
        } else {
            out.push_back(item);
        }
    }
}

HostValue flatten(const HelperArgs &args) {
    HostValue result = HostValue::array();
    flattenInto(requireArray(args, 0, "array.flatten"), result);
    return result;
}

HostValue chunk(const HelperArgs &args) {
    const HostValue &items = requireArray(args, 0, "array.chunk");
    int64_t size = requireInteger(args, 1, "array.chunk");
    if (size <= 0) {
        throw HelperError("array.chunk: size must be a positive integer");
    }

    HostValue chunks = HostValue::array();
    HostValue current = HostValue::array();
    for (const auto &item : items) {
        current.push_back(item);
        if (static_cast<int64_t>(current.size()) == size) {
            chunks.push_back(std::move(current));
            current = HostValue::array();
        }
    }
    if (!current.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

// Relational comparison of two property values; mixed or missing values compare equal
int compareValues(const HostValue *a, const HostValue *b) {
    if (!a || !b) {
        return 0;
    }
    if (a->is_number() && b->is_number()) {
        double x = a->get<double>();
        double y = b->get<double>();
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    if (a->is_string() && b->is_string()) {
        int order = a->get_ref<const std::string &>().compare(b->get_ref<const std::string &>());
        return order < 0 ? -1 : (order > 0 ? 1 : 0);
    }
    if (a->is_boolean() && b->is_boolean()) {
        return static_cast<int>(a->get<bool>()) - static_cast<int>(b->get<bool>());
    }
    return 0;
}

const HostValue *property(const HostValue &item, const std::string &key) {
    if (!item.is_object()) {
        return nullptr;
    }
    auto it = item.find(key);
    return it == item.end() ? nullptr : &*it;
}

HostValue sortBy(const HelperArgs &args) {
    const HostValue &items = requireArray(args, 0, "array.sortBy");
    const std::string &key = requireString(args, 1, "array.sortBy");

    // json iterators are not random access
    std::vector<HostValue> sorted(items.begin(), items.end());
    std::stable_sort(sorted.begin(), sorted.end(), [&key](const HostValue &a, const HostValue &b) {
        return compareValues(property(a, key), property(b, key)) < 0;
    });
    return HostValue(std::move(sorted));
}

// === object ===

HostValue keys(const HelperArgs &args) {
    const HostValue &source = requireObject(args, 0, "object.keys");
    HostValue result = HostValue::array();
    for (auto it = source.begin(); it != source.end(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

HostValue values(const HelperArgs &args) {
    HostValue result = HostValue::array();
    for (const auto &value : requireObject(args, 0, "object.values")) {
        result.push_back(value);
    }
    return result;
}

std::vector<std::string> requireKeyList(const HelperArgs &args, const char *helper) {
    const HostValue &list = requireArray(args, 1, helper);
    std::vector<std::string> keyList;
    for (const auto &key : list) {
        keyList.push_back(toDisplayString(key));
    }
    return keyList;
}

HostValue pick(const HelperArgs &args) {
    const HostValue &source = requireObject(args, 0, "object.pick");
    HostValue result = HostValue::object();
    for (const auto &key : requireKeyList(args, "object.pick")) {
        auto it = source.find(key);
        if (it != source.end()) {
            result[key] = *it;
        }
    }
    return result;
}

HostValue omit(const HelperArgs &args) {
    HostValue result = requireObject(args, 0, "object.omit");
    for (const auto &key : requireKeyList(args, "object.omit")) {
        result.erase(key);
    }
    return result;
}

// Shallow Object.assign({}, ...objects); non-object arguments are skipped
HostValue merge(const HelperArgs &args) {
    HostValue result = HostValue::object();
    for (const auto &source : args) {
        if (!source.is_object()) {
            continue;
        }
        for (auto it = source.begin(); it != source.end(); ++it) {
            result[it.key()] = it.value();
        }
    }
    return result;
}

}  // namespace

void registerCollectionHelpers(std::vector<HelperDescriptor> &out) {
    out.push_back({HelperNamespace::Array, "unique", 1, unique});
    out.push_back({HelperNamespace::Array, "flatten", 1, flatten});
    out.push_back({HelperNamespace::Array, "chunk", 2, chunk});
    out.push_back({HelperNamespace::Array, "sortBy", 2, sortBy});

    out.push_back({HelperNamespace::Object, "keys", 1, keys});
    out.push_back({HelperNamespace::Object, "values", 1, values});
    out.push_back({HelperNamespace::Object, "pick", 2, pick});
    out.push_back({HelperNamespace::Object, "omit", 2, omit});
    out.push_back({HelperNamespace::Object, "merge", 2, merge});
}

}  // namespace SBX
