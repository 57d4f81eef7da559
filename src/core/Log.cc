#include "toastkit/core/Log.hh"

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace toastkit::log {

namespace {
quill::Logger* g_logger = nullptr;
quill::Logger* g_logger_ui = nullptr;
quill::Logger* g_logger_render = nullptr;

const std::string kLogsDir = "logs";

std::shared_ptr<quill::Sink> makeFileSink(const std::string& filename) {
    return quill::Frontend::create_or_get_sink<quill::FileSink>(filename, []() {
        quill::FileSinkConfig cfg;
        cfg.set_open_mode('w');
        cfg.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        return cfg;
    }());
}

quill::PatternFormatterOptions makePattern() {
    quill::PatternFormatterOptions pattern;
    pattern.format_pattern = "%(time) [%(thread_id)] %(short_source_location:<28) "
                             "%(log_level:<9) %(message)";
    pattern.timestamp_pattern = "%H:%M:%S.%Qms";
    return pattern;
}

void startBackend() {
    quill::BackendOptions backend_opts;
    backend_opts.thread_name = "ToastkitLog";
    backend_opts.wait_for_queues_to_empty_before_exit = true;

    quill::Backend::start(backend_opts);
}

// Root: console + toastkit.log. Subsystems: console only.
void createLoggers(bool withFile) {
    auto console_sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console");
    auto pattern = makePattern();

    std::vector<std::shared_ptr<quill::Sink>> rootSinks{console_sink};
    if (withFile) {
        std::filesystem::create_directories(kLogsDir);
        rootSinks.push_back(makeFileSink(kLogsDir + "/toastkit.log"));
    }

    g_logger = quill::Frontend::create_or_get_logger("toastkit", rootSinks, pattern);
    g_logger_ui = quill::Frontend::create_or_get_logger("ui", console_sink, pattern);
    g_logger_render = quill::Frontend::create_or_get_logger("render", console_sink, pattern);

    for (auto* lg : {g_logger, g_logger_ui, g_logger_render}) {
        lg->set_log_level(quill::LogLevel::Info);
    }
}

// Hosts that never call init() still get console loggers on first use.
// Loggers are created once; a later init() keeps them console-only.
void ensureLoggers() {
    if (g_logger)
        return;
    startBackend();
    createLoggers(false);
}

} // namespace

void init() {
    if (g_logger)
        return;
    startBackend();
    createLoggers(true);
}

void shutdown() {
    for (auto* lg : {g_logger, g_logger_ui, g_logger_render}) {
        if (lg)
            lg->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* logger() {
    ensureLoggers();
    return g_logger;
}

quill::Logger* uiLogger() {
    ensureLoggers();
    return g_logger_ui;
}

quill::Logger* renderLogger() {
    ensureLoggers();
    return g_logger_render;
}

void setLevel(quill::LogLevel level) {
    if (g_logger) {
        g_logger->set_log_level(level);
    }
}

void setUILevel(quill::LogLevel level) {
    if (g_logger_ui)
        g_logger_ui->set_log_level(level);
}

void setRenderLevel(quill::LogLevel level) {
    if (g_logger_render)
        g_logger_render->set_log_level(level);
}

} // namespace toastkit::log
