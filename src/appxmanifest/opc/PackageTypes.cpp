#include "appxmanifest/opc/PackageTypes.hpp"
#include "appxmanifest/core/Constants.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace appxmanifest {
namespace opc {

namespace {

std::once_flag g_register_flag;
std::atomic<bool> g_registered{false};

// 注册完成后只读
std::map<std::string, const char*, std::less<>>& typeRegistry() {
    static std::map<std::string, const char*, std::less<>> registry;
    return registry;
}

void doRegister() {
    auto& registry = typeRegistry();
    registry.emplace(core::ContentType::kAppxManifest, "AppxManifest");
    registry.emplace(core::ContentType::kBundleManifest, "AppxBundleManifest");
    registry.emplace(core::ContentType::kBlockMap, "AppxBlockMap");
    registry.emplace(core::ContentType::kSignature, "AppxSignature");
    registry.emplace(core::ContentType::kCodeIntegrity, "CodeIntegrity");
    registry.emplace(core::ContentType::kPackage, "Package");
    registry.emplace(core::ContentType::kRelationships, "Relationships");
    registry.emplace(core::ContentType::kCoreProperties, "CoreProperties");

    g_registered.store(true, std::memory_order_release);
    OPC_DEBUG("Registered {} package content types", registry.size());
}

} // namespace

void registerPackageTypes() {
    std::call_once(g_register_flag, doRegister);
}

bool packageTypesRegistered() {
    return g_registered.load(std::memory_order_acquire);
}

const char* describeContentType(std::string_view content_type) {
    if (!packageTypesRegistered()) {
        return "unknown";
    }
    const auto& registry = typeRegistry();
    auto it = registry.find(content_type);
    return it != registry.end() ? it->second : "unknown";
}

}} // namespace appxmanifest::opc
