#pragma once

#include "talkback/server/ErrorTypes.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace talkback::server {

/**
 * @brief 服务配置（JSON 文档，按 "section.key" 访问）
 *
 * 文件中缺省的键取默认值；加载时先应用环境变量映射，再替换 ${ENV_VAR} 占位符。
 * 配置文件不存在时使用默认配置，并在该路径写出带占位符的模板。
 * 可被多个会话线程并发读取。
 */
class ConfigManager {
public:
    ConfigManager();

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * @brief 从文件加载
     *
     * 文件不存在时使用默认配置并写出模板，仍返回 true；err 中说明回退原因。
     */
    bool loadFromFile(const std::string& path, ErrorInfo* err = nullptr);

    // 解析失败或根不是 object 时返回 false，保留旧配置
    bool loadFromString(const std::string& jsonText, ErrorInfo* err = nullptr);

    nlohmann::json getRaw() const;

    std::optional<nlohmann::json> get(const std::string& keyPath) const;

    // 缺失、类型不符或空白字符串时返回 fallback
    std::string getString(const std::string& keyPath, const std::string& fallback) const;
    long long getInt(const std::string& keyPath, long long fallback) const;

    // 中间节点不存在时创建 object
    bool set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err = nullptr);

    void applyEnvironmentOverrides();

    // 返回全部问题，警告以 "WARN:" 开头
    std::vector<std::string> validate() const;

    static bool hasHardValidationErrors(const std::vector<std::string>& issues);

    static nlohmann::json makeDefaultConfig();

    // 写出默认模板（含 ${...} 占位符，不含真实密钥），必要时创建父目录
    static bool writeTemplate(const std::string& path, ErrorInfo* err = nullptr);

    // api_key / secret 类字段只保留首尾各 2 个字符
    static std::string redactSensitive(const std::string& keyPath, const std::string& value);

private:
    // "a.b.c" -> /a/b/c；空路径或空段返回 nullopt
    static std::optional<nlohmann::json::json_pointer> toPointer(const std::string& keyPath);

    // env 映射覆盖 + ${ENV_VAR} 替换，就地修改
    static void resolveEnvironment(nlohmann::json& root);
    static std::vector<std::string> validateJson(const nlohmann::json& cfg);

    mutable std::mutex m_mu;
    nlohmann::json m_cfg;
};

} // namespace talkback::server
