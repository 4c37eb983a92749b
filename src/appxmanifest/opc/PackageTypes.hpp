#pragma once

#include <string_view>

namespace appxmanifest {
namespace opc {

/**
 * @brief 注册已知的程序包部件内容类型（进程内只执行一次，可重复调用）
 *
 * 第一次打开容器时由PackageContainer调用。
 */
void registerPackageTypes();

/**
 * @brief 是否已经完成注册
 */
bool packageTypesRegistered();

/**
 * @brief 已知内容类型的简短描述，用于日志；未知类型返回"unknown"
 *
 * 内容类型按原样精确匹配。
 */
const char* describeContentType(std::string_view content_type);

}} // namespace appxmanifest::opc
