#include "helpers/HelperLibrary.h"
#include "common/Logger.h"

namespace SBX {

const char *helperNamespaceName(HelperNamespace ns) {
    switch (ns) {
    case HelperNamespace::String:
        return "string";
    case HelperNamespace::Math:
        return "math";
    case HelperNamespace::Number:
        return "number";
    case HelperNamespace::Array:
        return "array";
    case HelperNamespace::Object:
        return "object";
    case HelperNamespace::Date:
        return "date";
    case HelperNamespace::Console:
        return "console";
    }
    return "unknown";
}

std::string HelperDescriptor::qualifiedName() const {
    return std::string(helperNamespaceName(ns)) + "." + name;
}

HelperLibrary::HelperLibrary(std::vector<HelperDescriptor> descriptors) : descriptors_(std::move(descriptors)) {
    for (const auto &descriptor : descriptors_) {
        if (descriptor.ns != HelperNamespace::Console && !descriptor.function) {
            throw std::invalid_argument("Helper " + descriptor.qualifiedName() + " has no implementation");
        }
    }
}

std::shared_ptr<const HelperLibrary> HelperLibrary::createDefault() {
    std::vector<HelperDescriptor> descriptors;
    registerStringHelpers(descriptors);
    registerMathHelpers(descriptors);
    registerNumberHelpers(descriptors);
    registerCollectionHelpers(descriptors);
    registerDateHelpers(descriptors);

    descriptors.push_back({HelperNamespace::Console, "log", 0, nullptr, ConsoleLevel::Log});
    descriptors.push_back({HelperNamespace::Console, "info", 0, nullptr, ConsoleLevel::Info});
    descriptors.push_back({HelperNamespace::Console, "warn", 0, nullptr, ConsoleLevel::Warn});
    descriptors.push_back({HelperNamespace::Console, "error", 0, nullptr, ConsoleLevel::Error});

    LOG_DEBUG("HelperLibrary: Built default catalog with {} helpers", descriptors.size());
    return std::make_shared<const HelperLibrary>(std::move(descriptors));
}

int HelperLibrary::indexOf(HelperNamespace ns, const std::string &name) const {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        if (descriptors_[i].ns == ns && descriptors_[i].name == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const HelperDescriptor *HelperLibrary::find(HelperNamespace ns, const std::string &name) const {
    int index = indexOf(ns, name);
    return index < 0 ? nullptr : &descriptors_[static_cast<size_t>(index)];
}

std::vector<std::string> HelperLibrary::memberNames(HelperNamespace ns) const {
    std::vector<std::string> names;
    for (const auto &descriptor : descriptors_) {
        if (descriptor.ns == ns) {
            names.push_back(descriptor.name);
        }
    }
    return names;
}

HostValue HelperLibrary::invoke(size_t index, const HelperArgs &args) const {
    if (index >= descriptors_.size()) {
        throw HelperError("Unknown helper index " + std::to_string(index));
    }
    const auto &descriptor = descriptors_[index];
    if (!descriptor.function) {
        throw HelperError(descriptor.qualifiedName() + " is not a value helper");
    }
    return descriptor.function(args);
}

HostValue HelperLibrary::call(HelperNamespace ns, const std::string &name, const HelperArgs &args) const {
    int index = indexOf(ns, name);
    if (index < 0) {
        throw HelperError(std::string("helpers.") + helperNamespaceName(ns) + "." + name + " is not defined");
    }
    return invoke(static_cast<size_t>(index), args);
}

}  // namespace SBX
