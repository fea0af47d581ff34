#pragma once

#if defined _WIN32 || defined __CYGWIN__
#ifdef grommet_EXPORTS
#ifdef __GNUC__
#define GROMMET_EXPORT __attribute__ ((dllexport))
#else
#define GROMMET_EXPORT __declspec(dllexport)
#define GROMMET_DLL_WARNING_DISABLE_4251
#endif
#else
#ifdef __GNUC__
#define GROMMET_EXPORT __attribute__ ((dllimport))
#else
#define GROMMET_EXPORT __declspec(dllimport)
#endif
#endif
#else
#if __GNUC__ >= 4
#define GROMMET_EXPORT __attribute__ ((visibility ("default")))
#else
#define GROMMET_EXPORT
#endif
#endif

#ifdef GROMMET_DLL_WARNING_DISABLE_4251
#pragma warning( disable : 4251 )
#pragma warning( disable : 4275 )
#endif
