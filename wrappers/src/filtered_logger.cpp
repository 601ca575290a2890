
#include "../include/filtered_logger.hpp"
#include <open62541/types.h>

static const char* level_names[] = {"trace", "debug", "info", "warn", "error", "fatal"};
static const char* category_names[] = {"network", "channel", "session", "server", "client", "userland", "securitypolicy", "eventloop", "pubsub", "discovery"};

filtered_logger::filtered_logger() {
}

filtered_logger::~filtered_logger() {
}

void
filtered_logger::print_log(void* _log_context, UA_LogLevel _level, UA_LogCategory _category,
                    const char* _msg, va_list _args) {
    custom_log_context* ctx = (custom_log_context *)_log_context;

    if (_level < ctx->min_level_)
        return;
    size_t level_index = (size_t)(_level / 100) - 1;
    size_t category_index = (size_t)_category;
    fprintf(ctx->output_, "[%s/%s] ",
            level_index < sizeof(level_names) / sizeof(level_names[0]) ? level_names[level_index] : "log",
            category_index < sizeof(category_names) / sizeof(category_names[0]) ? category_names[category_index] : "other");
    vfprintf(ctx->output_, _msg, _args);
    fprintf(ctx->output_, "\n");
    fflush(ctx->output_);
}

void
filtered_logger::clear_logger(struct UA_Logger* _logger) {
    UA_free(_logger->context);
    UA_free(_logger);
}

UA_Logger*
filtered_logger::create_filtered_logger(UA_LogLevel _level, FILE* _output) {
    UA_Logger* logger = (UA_Logger *)UA_malloc(sizeof(UA_Logger));
    if (logger == NULL)
        return NULL;
    custom_log_context* ctx = (custom_log_context *)UA_malloc(sizeof(custom_log_context));
    if (ctx == NULL) {
        UA_free(logger);
        return NULL;
    }
    ctx->min_level_ = _level;
    ctx->output_ = _output;

    logger->log = print_log;
    logger->context = ctx;
    logger->clear = clear_logger;
    return logger;
}

bool
filtered_logger::parse_log_level(const std::string& _level_name, UA_LogLevel& _level) {
    if (_level_name == "trace") _level = UA_LOGLEVEL_TRACE;
    else if (_level_name == "debug") _level = UA_LOGLEVEL_DEBUG;
    else if (_level_name == "info") _level = UA_LOGLEVEL_INFO;
    else if (_level_name == "warning") _level = UA_LOGLEVEL_WARNING;
    else if (_level_name == "error") _level = UA_LOGLEVEL_ERROR;
    else if (_level_name == "fatal") _level = UA_LOGLEVEL_FATAL;
    else return false;
    return true;
}
