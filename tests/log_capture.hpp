#pragma once

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <sstream>
#include <string>

/// Routes the default spdlog logger into a string for the lifetime of the object.
class LogCapture {
   public:
    LogCapture()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)),
          previous_(spdlog::default_logger()) {
        auto logger = std::make_shared<spdlog::logger>("capture", sink_);
        logger->set_level(spdlog::level::debug);
        logger->set_pattern("%l %v");
        spdlog::set_default_logger(logger);
    }

    LogCapture(const LogCapture&) = delete;
    auto operator=(const LogCapture&) -> LogCapture& = delete;

    ~LogCapture() { spdlog::set_default_logger(previous_); }

    [[nodiscard]] auto text() const -> std::string { return stream_.str(); }

    [[nodiscard]] auto contains(const std::string& needle) const -> bool {
        return text().find(needle) != std::string::npos;
    }

   private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    std::shared_ptr<spdlog::logger> previous_;
};
