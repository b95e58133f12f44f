#ifndef GD_EXPORT_MACRO_HPP
#define GD_EXPORT_MACRO_HPP

#if defined _WIN32 || defined __CYGWIN__
#ifdef BUILDING_GD_CORE
#define GD_EXPORT __declspec(dllexport)
#else
#define GD_EXPORT __declspec(dllimport)
#endif
#else
#if __GNUC__ >= 4
#define GD_EXPORT __attribute__((visibility("default")))
#else
#define GD_EXPORT
#endif
#endif

#endif

