/**
 * @file meshshare_log_macros.h
 * @brief Shared logging macros for the transfer state machine sources.
 *
 * In TESTING builds the macros embed the `this` pointer so that
 * log lines from different EventManager instances can be distinguished.
 */

#ifndef MESHSHARE_LOG_MACROS_H
#define MESHSHARE_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_EVENTS_DEBUG(message) LOG_DEBUG("events", "[pointer: " << this << "] " << message)
#define LOG_EVENTS_INFO(message)  LOG_INFO("events", "[pointer: " << this << "] " << message)
#define LOG_EVENTS_WARN(message)  LOG_WARN("events", "[pointer: " << this << "] " << message)
#define LOG_EVENTS_ERROR(message) LOG_ERROR("events", "[pointer: " << this << "] " << message)

#define LOG_NOTIFY_DEBUG(message) LOG_DEBUG("notify", "[pointer: " << this << "] " << message)
#define LOG_NOTIFY_INFO(message)  LOG_INFO("notify", "[pointer: " << this << "] " << message)
#define LOG_NOTIFY_WARN(message)  LOG_WARN("notify", "[pointer: " << this << "] " << message)
#define LOG_NOTIFY_ERROR(message) LOG_ERROR("notify", "[pointer: " << this << "] " << message)
#else
#define LOG_EVENTS_DEBUG(message) LOG_DEBUG("events", message)
#define LOG_EVENTS_INFO(message)  LOG_INFO("events", message)
#define LOG_EVENTS_WARN(message)  LOG_WARN("events", message)
#define LOG_EVENTS_ERROR(message) LOG_ERROR("events", message)

#define LOG_NOTIFY_DEBUG(message) LOG_DEBUG("notify", message)
#define LOG_NOTIFY_INFO(message)  LOG_INFO("notify", message)
#define LOG_NOTIFY_WARN(message)  LOG_WARN("notify", message)
#define LOG_NOTIFY_ERROR(message) LOG_ERROR("notify", message)
#endif

#endif // MESHSHARE_LOG_MACROS_H
