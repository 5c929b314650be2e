#ifndef ETAGCACHE_LOGGER_HPP
#define ETAGCACHE_LOGGER_HPP

#include "common.hpp"

class Logger
{
private:
    // Define log levels using enum class for type safety and better semantics
    enum class LogLevel
    {
        INFO,
        WARNING,
        ERROR,
        SUCCESS,
        DEBUG
    };

    // ANSI escape codes for colors
    static constexpr std::array<const char *, 9> COLORS = {
        "\033[0m",  // RESET
        "\033[30m", // BLACK
        "\033[31m", // RED
        "\033[32m", // GREEN
        "\033[33m", // YELLOW
        "\033[34m", // BLUE
        "\033[35m", // MAGENTA
        "\033[36m", // CYAN
        "\033[37m", // WHITE
    };

    // Special symbols
    static constexpr const char *CHECK_MARK = "✅";
    static constexpr const char *CROSS_MARK = "❌";
    static constexpr const char *INFO_MARK = "\U0001F535";
    static constexpr const char *WARN_MARK = "⚠️";
    static constexpr const char *DEBUG_MARK = "\U0001F50D";

    // Constant string views for log levels
    static constexpr std::string_view LOG_LEVELS[] = {
        "INFO",
        "WARNING",
        "ERROR",
        "SUCCESS",
        "DEBUG"};

    static constexpr const char *LOG_FILE = "etagcache.log";

    // Log message with the context it was emitted for (host, resource or "-")
    struct LogMessage
    {
        std::string message;
        LogLevel level;
        std::string context;
        std::chrono::system_clock::time_point timestamp;

        LogMessage(std::string msg, LogLevel lvl, std::string ctx)
            : message(std::move(msg)), level(lvl), context(std::move(ctx)),
              timestamp(std::chrono::system_clock::now()) {}
    };

    // Memory management and synchronization members
    std::pmr::unsynchronized_pool_resource pool;
    std::pmr::deque<LogMessage> messageQueue{&pool};

    std::mutex mutex;
    std::ofstream logFile;
    std::condition_variable_any queueCV;
    std::jthread loggerThread;
    std::atomic<bool> verbose{false};

    static inline std::unique_ptr<Logger> instance;
    static inline std::once_flag initFlag;

    // Private helper functions
    [[nodiscard]] static std::string formatSuccess(const std::string &msg);
    [[nodiscard]] static std::string formatError(const std::string &msg);
    [[nodiscard]] static std::string formatInfo(const std::string &msg);
    [[nodiscard]] static std::string formatWarning(const std::string &msg);
    [[nodiscard]] static std::string formatDebug(const std::string &msg);
    [[nodiscard]] static std::string formatStep(int num, const std::string &msg);
    [[nodiscard]] std::string formatLogMessage(const LogMessage &msg);

    Logger();
    void processLogs(std::stop_token st);
    void drainQueue();
    void writeLogMessage(const LogMessage &msg);

public:
    static Logger *getInstance();
    static void destroyInstance();

    // debug messages are dropped unless verbose output is enabled
    void setVerbose(bool enabled);
    [[nodiscard]] bool isVerbose() const;

    void log(std::string_view message, LogLevel level = LogLevel::INFO,
             std::string_view context = "-");
    void error(std::string_view message, std::string_view context = "-");
    void warning(std::string_view message, std::string_view context = "-");
    void success(std::string_view message, std::string_view context = "-");
    void info(std::string_view message, std::string_view context = "-");
    void debug(std::string_view message, std::string_view context = "-");
    void step(int num, std::string_view message, std::string_view context = "-");

    ~Logger();

    // Delete copy and move operations
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;
};

#endif // ETAGCACHE_LOGGER_HPP
