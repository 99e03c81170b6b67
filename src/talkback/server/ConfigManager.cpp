#include "talkback/server/ConfigManager.h"
#include "talkback/server/utils/HttpSerialization.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace talkback::server {

namespace {

std::string trimCopy(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::optional<std::string> envValue(const std::string& name) {
    const char* v = name.empty() ? nullptr : std::getenv(name.c_str());
    if (!v || *v == '\0') return std::nullopt;
    return std::string(v);
}

struct EnvMapping {
    const char* env;
    const char* pointer;
    bool integer;
};

// 环境变量 -> 配置项；同一个 Deepgram key 同时用于 STT 与 TTS
const EnvMapping kEnvMappings[] = {
    {"DEEPGRAM_API_KEY", "/stt/api_key", false},
    {"DEEPGRAM_API_KEY", "/tts/api_key", false},
    {"GROQ_API_KEY", "/llm/api_key", false},
    {"LLM_BASE_URL", "/llm/base_url", false},
    {"LLM_MODEL", "/llm/model", false},
    {"TALKBACK_HOST", "/server/host", false},
    {"TALKBACK_PORT", "/server/port", true},
    {"TALKBACK_LOG_LEVEL", "/logging/level", false},
};

// ${NAME} 替换为环境变量值，未设置的保持原样
std::string expandPlaceholders(const std::string& s) {
    std::string out;
    size_t pos = 0;
    while (true) {
        const auto open = s.find("${", pos);
        const auto close = open == std::string::npos ? std::string::npos : s.find('}', open + 2);
        if (close == std::string::npos) {
            out.append(s, pos, std::string::npos);
            return out;
        }
        out.append(s, pos, open - pos);
        const auto value = envValue(s.substr(open + 2, close - open - 2));
        out += value ? *value : s.substr(open, close - open + 1);
        pos = close + 1;
    }
}

void expandPlaceholdersIn(nlohmann::json& node) {
    if (node.is_string()) {
        node = expandPlaceholders(node.get<std::string>());
    } else if (node.is_structured()) {
        for (auto& child : node) expandPlaceholdersIn(child);
    }
}

bool isSensitiveKey(const std::string& keyPath) {
    std::string low;
    for (char c : keyPath) low.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    for (const char* marker : {"api_key", "apikey", "secret"}) {
        if (low.find(marker) != std::string::npos) return true;
    }
    return false;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

std::optional<nlohmann::json::json_pointer> ConfigManager::toPointer(const std::string& keyPath) {
    if (keyPath.empty()) return std::nullopt;
    std::string ptr;
    size_t start = 0;
    while (start <= keyPath.size()) {
        const auto dot = std::min(keyPath.find('.', start), keyPath.size());
        if (dot == start) return std::nullopt;
        ptr += '/';
        for (size_t i = start; i < dot; ++i) {
            // RFC 6901 转义
            if (keyPath[i] == '~') ptr += "~0";
            else if (keyPath[i] == '/') ptr += "~1";
            else ptr += keyPath[i];
        }
        start = dot + 1;
    }
    return nlohmann::json::json_pointer(ptr);
}

void ConfigManager::resolveEnvironment(nlohmann::json& root) {
    for (const auto& m : kEnvMappings) {
        auto v = envValue(m.env);
        if (!v) continue;
        const auto val = trimCopy(*v);
        if (val.empty()) continue;

        auto& slot = root[nlohmann::json::json_pointer(m.pointer)];
        if (m.integer) {
            char* end = nullptr;
            const long long n = std::strtoll(val.c_str(), &end, 10);
            // 非整数保留为字符串，交给 validate() 报告
            if (end && *end == '\0') slot = n;
            else slot = val;
        } else {
            slot = val;
        }
    }
    expandPlaceholdersIn(root);
}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (ifs.is_open()) {
        std::ostringstream text;
        text << ifs.rdbuf();
        return loadFromString(text.str(), err);
    }

    auto cfg = makeDefaultConfig();
    resolveEnvironment(cfg);
    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(cfg);
    }

    ErrorInfo writeErr;
    const bool written = writeTemplate(path, &writeErr);
    if (err) {
        *err = ErrorInfo::make(ErrorType::UnknownError,
            "Config file not found, using defaults and writing a template to " + path);
        err->details = nlohmann::json{{"path", path}, {"template_written", written}};
        if (!written) (*err->details)["write_error"] = writeErr.toJson();
    }
    return true;
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    auto parsed = nlohmann::json::parse(jsonText, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        if (err) {
            *err = ErrorInfo::make(ErrorType::InvalidRequest,
                parsed.is_discarded() ? "Config JSON parse failed" : "Config root must be a JSON object");
            err->details = nlohmann::json{{"snippet", utils::truncateUtf8(jsonText, 256)}};
        }
        return false;
    }

    auto merged = makeDefaultConfig();
    merged.merge_patch(parsed);
    resolveEnvironment(merged);

    std::lock_guard<std::mutex> lk(m_mu);
    m_cfg = std::move(merged);
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::writeTemplate(const std::string& path, ErrorInfo* err) {
    const std::filesystem::path file(path);
    std::error_code ec;
    if (file.has_parent_path()) {
        std::filesystem::create_directories(file.parent_path(), ec);
        if (ec) {
            if (err) {
                *err = ErrorInfo::make(ErrorType::UnknownError,
                    "Failed to create config directory " + file.parent_path().string() + ": " + ec.message());
            }
            return false;
        }
    }

    std::ofstream ofs(file, std::ios::out | std::ios::binary | std::ios::trunc);
    if (ofs) ofs << makeDefaultConfig().dump(2) << '\n';
    if (!ofs) {
        if (err) *err = ErrorInfo::make(ErrorType::UnknownError, "Failed to write config template " + path);
        return false;
    }
    return true;
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto ptr = toPointer(keyPath);
    if (!ptr) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    if (!m_cfg.contains(*ptr)) return std::nullopt;
    return m_cfg.at(*ptr);
}

std::string ConfigManager::getString(const std::string& keyPath, const std::string& fallback) const {
    const auto v = get(keyPath);
    if (!v || !v->is_string()) return fallback;
    auto s = trimCopy(v->get<std::string>());
    return s.empty() ? fallback : s;
}

long long ConfigManager::getInt(const std::string& keyPath, long long fallback) const {
    const auto v = get(keyPath);
    if (!v || !v->is_number()) return fallback;
    return v->is_number_integer() ? v->get<long long>() : static_cast<long long>(v->get<double>());
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto ptr = toPointer(keyPath);
    if (!ptr) {
        if (err) *err = ErrorInfo::make(ErrorType::InvalidRequest, "Invalid keyPath: '" + keyPath + "'");
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    try {
        m_cfg[*ptr] = v;
    } catch (const nlohmann::json::exception& e) {
        // 路径上已有非 object 的值
        if (err) *err = ErrorInfo::make(ErrorType::InvalidRequest, "Cannot set '" + keyPath + "': " + e.what());
        return false;
    }
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    resolveEnvironment(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "talkback voice server config template (auto-generated). JSON has no comments; use _comment fields.";
    j["server"] = {
        {"host", "0.0.0.0"},
        {"port", 8080},
        {"path", "/ws"}
    };
    j["stt"] = {
        {"_comment", "api_key is recommended to be injected via env var, avoid plaintext on disk."},
        {"provider", "deepgram"},
        {"base_url", "wss://api.deepgram.com/v1/listen"},
        {"api_key", "${DEEPGRAM_API_KEY}"},
        {"model", "nova-2"},
        {"language", "en-US"},
        {"encoding", "linear16"},
        {"sample_rate", 16000},
        {"channels", 1}
    };
    j["llm"] = {
        {"base_url", "https://api.groq.com/openai/v1"},
        {"api_key", "${GROQ_API_KEY}"},
        {"model", "llama3-8b-8192"},
        {"system_prompt", "You are a friendly voice assistant. Keep answers short and conversational; they will be read aloud."},
        {"temperature", 0.7},
        {"max_tokens", 512},
        {"timeout_ms", 30000},
        {"max_retries", 1}
    };
    j["tts"] = {
        {"base_url", "https://api.deepgram.com/v1/speak"},
        {"api_key", "${DEEPGRAM_API_KEY}"},
        {"model", "aura-asteria-en"},
        {"encoding", "mp3"},
        {"timeout_ms", 30000}
    };
    j["turn"] = {
        {"finalize_timeout_ms", 5000},
        {"pending_frame_limit", 256},
        {"stt_open_retries", 3},
        {"stt_retry_initial_delay_ms", 250}
    };
    j["history"] = {
        {"max_messages", 20}
    };
    j["logging"] = {
        {"level", "info"}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKey(keyPath)) return value;
    const auto v = trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

namespace {

void checkUrl(const nlohmann::json& section, const std::string& name,
              const std::vector<std::string>& schemes, std::vector<std::string>& out) {
    const std::string key = name + ".base_url";
    if (!section.contains("base_url") || !section["base_url"].is_string() || section["base_url"].get<std::string>().empty()) {
        out.push_back("Missing or invalid '" + key + "' (string required)");
        return;
    }
    const auto url = section["base_url"].get<std::string>();
    for (const auto& scheme : schemes) {
        if (url.compare(0, scheme.size(), scheme) == 0) return;
    }
    std::string list;
    for (const auto& scheme : schemes) {
        if (!list.empty()) list += " or ";
        list += scheme;
    }
    out.push_back("Invalid '" + key + "' (must start with " + list + ")");
}

void checkApiKey(const nlohmann::json& section, const std::string& name, std::vector<std::string>& out) {
    const std::string key = name + ".api_key";
    if (!section.contains("api_key") || !section["api_key"].is_string()) {
        out.push_back("Missing or invalid '" + key + "' (string required)");
        return;
    }
    const auto v = section["api_key"].get<std::string>();
    if (v.empty()) {
        out.push_back("Invalid '" + key + "' (empty)");
    } else if (v.rfind("${", 0) == 0 && v.find('}') != std::string::npos) {
        // 仍为占位符，通常意味着 env 未提供
        out.push_back("Invalid '" + key + "' (unresolved env placeholder): " + ConfigManager::redactSensitive(key, v));
    }
}

void checkIntRange(const nlohmann::json& section, const std::string& name, const char* field,
                   long long lo, long long hi, std::vector<std::string>& out) {
    if (!section.contains(field)) return;
    const std::string key = name + "." + field;
    if (!section[field].is_number_integer()) {
        out.push_back("Invalid '" + key + "' (integer required)");
        return;
    }
    const auto v = section[field].get<long long>();
    if (v < lo || v > hi) {
        out.push_back("Invalid '" + key + "' (range " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
    }
}

const nlohmann::json* sectionOf(const nlohmann::json& root, const char* name, std::vector<std::string>& out) {
    if (!root.contains(name) || !root[name].is_object()) {
        out.push_back(std::string("Missing or invalid '") + name + "' object");
        return nullptr;
    }
    return &root[name];
}

} // namespace

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfg) {
    std::vector<std::string> out;

    if (const auto* server = sectionOf(cfg, "server", out)) {
        checkIntRange(*server, "server", "port", 1, 65535, out);
        if (server->contains("path")) {
            const auto& p = (*server)["path"];
            if (!p.is_string() || !startsWith(p.get<std::string>(), "/")) {
                out.push_back("Invalid 'server.path' (must start with /)");
            }
        }
    }

    if (const auto* stt = sectionOf(cfg, "stt", out)) {
        if (stt->contains("provider") && (*stt)["provider"] != "deepgram") {
            out.push_back("Invalid 'stt.provider' (only 'deepgram' is supported)");
        }
        checkUrl(*stt, "stt", {"wss://"}, out);
        checkApiKey(*stt, "stt", out);
        checkIntRange(*stt, "stt", "sample_rate", 8000, 48000, out);
        checkIntRange(*stt, "stt", "channels", 1, 8, out);
    }

    if (const auto* llm = sectionOf(cfg, "llm", out)) {
        checkUrl(*llm, "llm", {"https://", "http://"}, out);
        checkApiKey(*llm, "llm", out);
        if (!llm->contains("model") || !(*llm)["model"].is_string() || (*llm)["model"].get<std::string>().empty()) {
            out.push_back("Missing or invalid 'llm.model' (string required)");
        }
        checkIntRange(*llm, "llm", "timeout_ms", 1, 300000, out);
        checkIntRange(*llm, "llm", "max_retries", 0, 5, out);
        checkIntRange(*llm, "llm", "max_tokens", 1, 32768, out);
        if (llm->contains("temperature")) {
            const auto& t = (*llm)["temperature"];
            if (!t.is_number() || t.get<double>() < 0.0 || t.get<double>() > 2.0) {
                out.push_back("Invalid 'llm.temperature' (number in 0..2 required)");
            }
        }
    }

    if (const auto* tts = sectionOf(cfg, "tts", out)) {
        checkUrl(*tts, "tts", {"https://", "http://"}, out);
        checkApiKey(*tts, "tts", out);
        checkIntRange(*tts, "tts", "timeout_ms", 1, 300000, out);
    }

    if (const auto* turn = sectionOf(cfg, "turn", out)) {
        checkIntRange(*turn, "turn", "finalize_timeout_ms", 1, 120000, out);
        checkIntRange(*turn, "turn", "pending_frame_limit", 1, 100000, out);
        checkIntRange(*turn, "turn", "stt_open_retries", 0, 10, out);
        checkIntRange(*turn, "turn", "stt_retry_initial_delay_ms", 0, 60000, out);
        if (turn->contains("finalize_timeout_ms") && (*turn)["finalize_timeout_ms"].is_number_integer() &&
            (*turn)["finalize_timeout_ms"].get<long long>() < 500) {
            out.push_back("WARN: turn.finalize_timeout_ms below 500ms usually truncates the last words");
        }
    }

    if (cfg.contains("history") && cfg["history"].is_object()) {
        checkIntRange(cfg["history"], "history", "max_messages", 0, 1000, out);
    }

    if (cfg.contains("logging") && cfg["logging"].is_object() && cfg["logging"].contains("level")) {
        const auto& lv = cfg["logging"]["level"];
        static const char* kLevels[] = {"error", "warning", "warn", "info", "debug"};
        bool ok = false;
        if (lv.is_string()) {
            std::string low = lv.get<std::string>();
            std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            ok = std::find(std::begin(kLevels), std::end(kLevels), low) != std::end(kLevels);
        }
        if (!ok) out.push_back("WARN: unknown 'logging.level', falling back to info");
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

} // namespace talkback::server
