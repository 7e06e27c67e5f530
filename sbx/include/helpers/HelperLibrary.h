#pragma once

#include "SBXTypes.h"
#include <array>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace SBX {

/**
 * @brief Helper namespaces reachable as helpers.<namespace> inside a script
 */
enum class HelperNamespace { String, Math, Number, Array, Object, Date, Console };

constexpr std::array<HelperNamespace, 7> ALL_HELPER_NAMESPACES = {
    HelperNamespace::String, HelperNamespace::Math,   HelperNamespace::Number, HelperNamespace::Array,
    HelperNamespace::Object, HelperNamespace::Date, HelperNamespace::Console};

const char *helperNamespaceName(HelperNamespace ns);

/**
 * @brief Invalid helper arguments; surfaces as a TypeError inside the sandbox
 */
class HelperError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using HelperArgs = std::vector<HostValue>;
using HelperFunction = std::function<HostValue(const HelperArgs &)>;

/**
 * @brief One catalog entry
 *
 * Console entries carry no function: the bridge routes them to the invocation's
 * ConsoleBuffer at consoleLevel.
 */
struct HelperDescriptor {
    HelperNamespace ns = HelperNamespace::String;
    std::string name;
    int arity = 0;
    HelperFunction function;
    ConsoleLevel consoleLevel = ConsoleLevel::Log;

    std::string qualifiedName() const;
};

/**
 * @brief Immutable catalog of safe helper functions
 *
 * Built once at start-up and shared by reference between concurrent invocations.
 * Functions are pure over JSON values (math.random and date.now aside) and signal bad
 * input with HelperError.
 *
 * @code
 * auto helpers = SBX::HelperLibrary::createDefault();
 * SBX::SandboxRuntimeManager manager(config, helpers);
 * @endcode
 */
class HelperLibrary {
public:
    explicit HelperLibrary(std::vector<HelperDescriptor> descriptors);

    /**
     * @brief Standard catalog: string, math, number, array, object, date and console
     */
    static std::shared_ptr<const HelperLibrary> createDefault();

    const std::vector<HelperDescriptor> &getDescriptors() const {
        return descriptors_;
    }

    /**
     * @brief Index of ns.name in getDescriptors(), or -1
     */
    int indexOf(HelperNamespace ns, const std::string &name) const;

    const HelperDescriptor *find(HelperNamespace ns, const std::string &name) const;

    std::vector<std::string> memberNames(HelperNamespace ns) const;

    /**
     * @brief Call a non-console helper by descriptor index
     * @throws HelperError for bad arguments or an index that is not a callable helper
     */
    HostValue invoke(size_t index, const HelperArgs &args) const;

    /**
     * @brief Convenience lookup-and-call, mainly for host code and tests
     */
    HostValue call(HelperNamespace ns, const std::string &name, const HelperArgs &args) const;

private:
    std::vector<HelperDescriptor> descriptors_;
};

// Catalog sections, one per source file under src/helpers
void registerStringHelpers(std::vector<HelperDescriptor> &out);
void registerNumberHelpers(std::vector<HelperDescriptor> &out);
void registerMathHelpers(std::vector<HelperDescriptor> &out);
void registerCollectionHelpers(std::vector<HelperDescriptor> &out);
void registerDateHelpers(std::vector<HelperDescriptor> &out);

}  // namespace SBX
