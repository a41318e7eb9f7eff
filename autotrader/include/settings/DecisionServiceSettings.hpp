#pragma once

#include <cstdlib>
#include <string>

namespace autotrader::settings
{

    /**
     * @brief Настройки OpenAI-совместимого сервиса решений
     *
     * AUTOTRADER_AI_API_KEY (или OPENAI_API_KEY) обязателен для реальных вызовов;
     * без ключа каждый вызов завершается DecisionError.
     */
    class DecisionServiceSettings
    {
    public:
        DecisionServiceSettings()
        {
            host_ = getEnvOrDefault("AUTOTRADER_AI_HOST", "api.openai.com");
            port_ = std::stoi(getEnvOrDefault("AUTOTRADER_AI_PORT", "443"));
            path_ = getEnvOrDefault("AUTOTRADER_AI_PATH", "/v1/chat/completions");
            apiKey_ = getEnvOrDefault("AUTOTRADER_AI_API_KEY", getEnvOrDefault("OPENAI_API_KEY", "").c_str());
            timeoutSeconds_ = std::stoi(getEnvOrDefault("AUTOTRADER_AI_TIMEOUT_SECONDS", "30"));
            maxRetries_ = std::stoi(getEnvOrDefault("AUTOTRADER_AI_MAX_RETRIES", "2"));
        }

        std::string getHost() const { return host_; }
        int getPort() const { return port_; }
        std::string getPath() const { return path_; }
        std::string getApiKey() const { return apiKey_; }
        int getTimeoutSeconds() const { return timeoutSeconds_; }
        int getMaxRetries() const { return maxRetries_; }

        void setApiKey(const std::string &key) { apiKey_ = key; }
        void setMaxRetries(int retries) { maxRetries_ = retries; }

    private:
        std::string host_;
        int port_;
        std::string path_;
        std::string apiKey_;
        int timeoutSeconds_;
        int maxRetries_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace autotrader::settings
