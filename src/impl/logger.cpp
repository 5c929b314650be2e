#include "logger.hpp"

// Helper functions for formatting with colors
std::string Logger::formatSuccess(const std::string &msg)
{
    return std::string(COLORS[3]) + CHECK_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatError(const std::string &msg)
{
    return std::string(COLORS[2]) + CROSS_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatInfo(const std::string &msg)
{
    return std::string(COLORS[5]) + INFO_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatWarning(const std::string &msg)
{
    return std::string(COLORS[4]) + WARN_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatDebug(const std::string &msg)
{
    return std::string(COLORS[7]) + DEBUG_MARK + " " + msg + COLORS[0];
}

std::string Logger::formatStep(int num, const std::string &msg)
{
    return std::string(COLORS[6]) + "[Step " + std::to_string(num) + "] " + msg + COLORS[0];
}

Logger::Logger()
{
    logFile.open(LOG_FILE, std::ios::app);
    loggerThread = std::jthread([this](std::stop_token st)
                                { processLogs(st); });
    writeLogMessage({{"Logger initialized"}, LogLevel::SUCCESS, "-"});
}

void Logger::processLogs(std::stop_token st)
{
    while (!st.stop_requested())
    {
        std::vector<LogMessage> messages;
        messages.reserve(100);

        {
            std::unique_lock lock(mutex);
            // wakes up on new messages or when a stop is requested
            if (queueCV.wait_for(lock, st, std::chrono::seconds(1),
                                 [this]
                                 { return !messageQueue.empty(); }))
            {
                while (!messageQueue.empty() && messages.size() < 100)
                {
                    messages.push_back(std::move(messageQueue.front())); // move message to vector
                    messageQueue.pop_front();                            // remove message from queue
                }
            }
        }

        for (const auto &msg : messages)
        {
            writeLogMessage(msg);
        }
        if (!messages.empty())
        {
            logFile.flush();
        }
    }
}

// write out whatever is still queued, used once the writer thread is gone
void Logger::drainQueue()
{
    std::unique_lock lock(mutex);
    while (!messageQueue.empty())
    {
        writeLogMessage(messageQueue.front());
        messageQueue.pop_front();
    }
    logFile.flush();
}

void Logger::writeLogMessage(const LogMessage &msg)
{
    std::string fileMessage = formatLogMessage(msg);
    if (logFile.is_open())
    {
        logFile << fileMessage << '\n';
    }

    std::string consoleMessage;
    switch (msg.level)
    {
    case LogLevel::ERROR:
        consoleMessage = formatError(fileMessage);
        break;
    case LogLevel::WARNING:
        consoleMessage = formatWarning(fileMessage);
        break;
    case LogLevel::SUCCESS:
        consoleMessage = formatSuccess(fileMessage);
        break;
    case LogLevel::DEBUG:
        consoleMessage = formatDebug(fileMessage);
        break;
    default:
        consoleMessage = formatInfo(fileMessage);
        break;
    }
    std::cout << consoleMessage << std::endl;
}

std::string Logger::formatLogMessage(const LogMessage &msg)
{
    auto time = std::chrono::system_clock::to_time_t(msg.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  msg.timestamp.time_since_epoch()) %
              1000;

    std::tm localTime{};
    localtime_r(&time, &localTime);

    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "[%Y-%m-%d %H:%M:%S]", &localTime);

    std::ostringstream oss;
    oss << timestamp << "."
        << std::setfill('0') << std::setw(3) << ms.count()
        << " [" << LOG_LEVELS[static_cast<int>(msg.level)] << "] "
        << "[" << msg.context << "] "
        << msg.message;

    return oss.str();
}

Logger *Logger::getInstance()
{
    std::call_once(initFlag, []()
                   { instance = std::unique_ptr<Logger>(new Logger()); });
    return instance.get();
}

void Logger::setVerbose(bool enabled)
{
    verbose = enabled;
}

bool Logger::isVerbose() const
{
    return verbose;
}

void Logger::log(std::string_view message, LogLevel level, std::string_view context)
{
    if (level == LogLevel::DEBUG && !verbose)
    {
        return;
    }

    {
        std::unique_lock lock(mutex);
        messageQueue.emplace_back(std::string(message), level, std::string(context));
    }
    queueCV.notify_one();
}

void Logger::error(std::string_view message, std::string_view context)
{
    log(message, LogLevel::ERROR, context);
}

void Logger::warning(std::string_view message, std::string_view context)
{
    log(message, LogLevel::WARNING, context);
}

void Logger::success(std::string_view message, std::string_view context)
{
    log(message, LogLevel::SUCCESS, context);
}

void Logger::info(std::string_view message, std::string_view context)
{
    log(message, LogLevel::INFO, context);
}

void Logger::debug(std::string_view message, std::string_view context)
{
    log(message, LogLevel::DEBUG, context);
}

void Logger::step(int num, std::string_view message, std::string_view context)
{
    log(formatStep(num, std::string(message)), LogLevel::INFO, context);
}

void Logger::destroyInstance()
{
    instance.reset();
}

Logger::~Logger()
{
    // stop the writer thread first so nothing races with the final drain
    loggerThread.request_stop();
    queueCV.notify_all();
    if (loggerThread.joinable())
    {
        loggerThread.join();
    }
    drainQueue();
    if (logFile.is_open())
    {
        logFile.close();
    }
}
