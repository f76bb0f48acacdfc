/**
 * @file transfer_log_macros.h
 * @brief Shared logging macros for the transfer queue sources.
 *
 * In TESTING builds the macros embed the `this` pointer so that
 * log lines from different manager instances can be distinguished.
 */

#ifndef PEERQ_TRANSFER_LOG_MACROS_H
#define PEERQ_TRANSFER_LOG_MACROS_H

#include "logger.h"

#ifdef TESTING
#define LOG_TRANSFERS_DEBUG(message) LOG_DEBUG("transfers", "[pointer: " << this << "] " << message)
#define LOG_TRANSFERS_INFO(message)  LOG_INFO("transfers", "[pointer: " << this << "] " << message)
#define LOG_TRANSFERS_WARN(message)  LOG_WARN("transfers", "[pointer: " << this << "] " << message)
#define LOG_TRANSFERS_ERROR(message) LOG_ERROR("transfers", "[pointer: " << this << "] " << message)
#else
#define LOG_TRANSFERS_DEBUG(message) LOG_DEBUG("transfers", message)
#define LOG_TRANSFERS_INFO(message)  LOG_INFO("transfers", message)
#define LOG_TRANSFERS_WARN(message)  LOG_WARN("transfers", message)
#define LOG_TRANSFERS_ERROR(message) LOG_ERROR("transfers", message)
#endif

#define LOG_DOWNLOADS_DEBUG(message) LOG_DEBUG("downloads", message)
#define LOG_DOWNLOADS_INFO(message)  LOG_INFO("downloads", message)
#define LOG_DOWNLOADS_WARN(message)  LOG_WARN("downloads", message)
#define LOG_DOWNLOADS_ERROR(message) LOG_ERROR("downloads", message)

#define LOG_UPLOADS_DEBUG(message) LOG_DEBUG("uploads", message)
#define LOG_UPLOADS_INFO(message)  LOG_INFO("uploads", message)
#define LOG_UPLOADS_WARN(message)  LOG_WARN("uploads", message)
#define LOG_UPLOADS_ERROR(message) LOG_ERROR("uploads", message)

#endif // PEERQ_TRANSFER_LOG_MACROS_H
