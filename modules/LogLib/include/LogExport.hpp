#ifndef LOG_EXPORT_HPP
#define LOG_EXPORT_HPP

/**
 * @file LogExport.hpp
 * @brief Shared-library visibility macros for LogLib
 */

#if defined(HYBRIDLINK_STATIC) && !defined(HYBRIDLINK_LOG_STATIC)
#define HYBRIDLINK_LOG_STATIC
#endif

#if defined(_WIN32) || defined(__CYGWIN__)
#ifdef HYBRIDLINK_LOG_STATIC
#define HYBRIDLINK_LOG_API
#elif defined(HYBRIDLINK_LOG_EXPORTS)
#define HYBRIDLINK_LOG_API __declspec(dllexport)
#else
#define HYBRIDLINK_LOG_API __declspec(dllimport)
#endif
#else
#if __GNUC__ >= 4
#define HYBRIDLINK_LOG_API __attribute__((visibility("default")))
#else
#define HYBRIDLINK_LOG_API
#endif
#endif

#endif // LOG_EXPORT_HPP
