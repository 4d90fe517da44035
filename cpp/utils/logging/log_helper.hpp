#pragma once
#include "logger.hpp"

/**
 * Component-tagged logging macros
 * Usage: LOG_INFO_COMP("PAPER", "message") or LOG_WARN_COMP_META("SESSION", "message", {{"user", id}})
 */
#define LOG_INFO_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.info(msg); \
    } while(0)

#define LOG_WARN_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.warn(msg); \
    } while(0)

#define LOG_ERROR_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.error(msg); \
    } while(0)

#define LOG_DEBUG_COMP(component, msg) \
    do { \
        logging::Logger logger(component); \
        logger.debug(msg); \
    } while(0)

#define LOG_INFO_COMP_META(component, msg, ...) \
    do { \
        logging::Logger logger(component); \
        logger.info(msg, __VA_ARGS__); \
    } while(0)

#define LOG_WARN_COMP_META(component, msg, ...) \
    do { \
        logging::Logger logger(component); \
        logger.warn(msg, __VA_ARGS__); \
    } while(0)
