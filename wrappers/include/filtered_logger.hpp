/**
 * @file filtered_logger.hpp
 * @brief Create open62541 logger instances filtered by a minimum level.
 */
#ifndef FILTERED_LOGGER_HPP
#define FILTERED_LOGGER_HPP

#include <open62541/plugin/log.h>
#include <stdarg.h>
#include <stdio.h>
#include <string>

/**
 * @brief Context object specifying the minimal log level.
 */
typedef struct {
    UA_LogLevel min_level_; /**< minimum log level accepted. */
    FILE* output_; /**< stream receiving the accepted messages. */
} custom_log_context;

/**
 * @brief Factory for level filtered UA_Logger objects.
 */
class filtered_logger {
private:
    /**
     * @brief Prints messages at or above the minimum level to the context's stream.
     * 
     * @param _log_context the log context.
     * @param _level the log level.
     * @param _category the log category.
     * @param _msg the message.
     * @param _args the message format args.
     */
    static void 
    print_log(void* _log_context, UA_LogLevel _level, UA_LogCategory _category, const char* _msg, va_list _args);

    /**
     * @brief Cleanup hook freeing the context and the logger itself.
     * 
     * @param _logger the logger to be cleared.
     */
    static void
    clear_logger(struct UA_Logger* _logger);
public:
    /**
     * @brief Constructs a new filtered logger object.
     * 
     */
    filtered_logger();

    /**
     * @brief Destroys the filtered logger object.
     * 
     */
    ~filtered_logger();

    /**
     * @brief Creates a heap allocated filtered logger. Ownership passes to the config it is set on,
     * whose clear hook frees it.
     * 
     * @param _level minimum log level.
     * @param _output the stream receiving the messages, not owned.
     * @return UA_Logger* the logger or nullptr if allocation failed.
     */
    UA_Logger*
    create_filtered_logger(UA_LogLevel _level, FILE* _output = stdout);

    /**
     * @brief Parses a level name (trace, debug, info, warning, error, fatal).
     * 
     * @param _level_name the level name.
     * @param _level the parsed level.
     * @return true if the name is known.
     * @return false if the name is unknown, _level is left untouched.
     */
    static bool
    parse_log_level(const std::string& _level_name, UA_LogLevel& _level);
};

#endif // FILTERED_LOGGER_HPP
