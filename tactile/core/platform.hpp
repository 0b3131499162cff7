#ifndef D3A6F0B2_5C81_4E27_9B1D_7A0E42C9F615
#define D3A6F0B2_5C81_4E27_9B1D_7A0E42C9F615

#if defined(_WIN32)
#define TC_WINDOWS 1
#elif defined(__ANDROID__)
#define TC_ANDROID 1
#elif defined(__APPLE__)
#include <TargetConditionals.h>
#define TC_APPLE 1

#if TARGET_OS_IPHONE
#define TC_IOS 1
#else
#define TC_OSX 1
#endif

#elif defined(__linux__)
#define TC_LINUX 1
#else
#define TC_UNKNOWN 1
#endif

#ifndef TC_ANDROID
#define TC_ANDROID 0
#endif

#ifndef TC_APPLE
#define TC_APPLE 0
#endif

#ifndef TC_OSX
#define TC_OSX 0
#endif

#ifndef TC_IOS
#define TC_IOS 0
#endif

#ifndef TC_WINDOWS
#define TC_WINDOWS 0
#endif

#ifndef TC_LINUX
#define TC_LINUX 0
#endif

#endif /* D3A6F0B2_5C81_4E27_9B1D_7A0E42C9F615 */
