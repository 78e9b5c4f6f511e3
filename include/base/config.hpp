/**
 * @file config.hpp
 * @brief INI 格式配置文件解析器
 *
 * 线程安全的单例配置管理器，支持从 INI 文件或内存文本加载配置，
 * 并按 section/key 方式访问配置项。
 */

#pragma once

#include <string>
#include <unordered_map>
#include <mutex>

namespace paneltalk {

/**
 * @class Config
 * @brief 线程安全的 INI 配置文件解析器（单例模式）
 *
 * 支持标准 INI 格式：
 * - [section] 定义配置节
 * - key = value 定义配置项
 * - ; 或 # 开头的行为注释
 *
 * @par 使用示例
 * @code
 * Config::instance().load("paneltalk.ini");
 * int tick = Config::instance().get_int("render", "tick_ms", 250);
 * @endcode
 */
class Config {
public:
    static Config& instance();

    /**
     * @brief 从文件加载配置
     * @return false 文件不存在或无法打开
     *
     * @note 调用此方法会清空之前加载的所有配置
     */
    bool load(const std::string& filename);

    /**
     * @brief 从字符串加载配置（格式同文件）
     *
     * @note 同样会清空之前的配置
     */
    void load_from_string(const std::string& content);

    /// 清空所有配置项
    void clear();

    std::string get(const std::string& section, const std::string& key, const std::string& default_value = "");

    /**
     * @brief 获取整数类型的配置值
     *
     * 配置项不存在或为空时返回 default_value。
     * @throws std::invalid_argument 值不是完整的整数或超出 int 范围
     */
    int get_int(const std::string& section, const std::string& key, int default_value = 0);

    /**
     * @brief 获取布尔类型的配置值
     *
     * 识别 true/false、yes/no、on/off、1/0（不区分大小写），
     * 其他值返回 default_value。
     */
    bool get_bool(const std::string& section, const std::string& key, bool default_value = false);

private:
    Config() = default;
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void parse_line(const std::string& raw, std::string& current_section);

    static std::string trim(const std::string& str);

    /// section -> (key -> value)
    std::unordered_map<std::string, std::unordered_map<std::string, std::string>> data_;
    std::mutex mutex_;
};

} // namespace paneltalk
