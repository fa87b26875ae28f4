#pragma once

#include <StormByte/platform.h>

#ifdef WINDOWS
	#ifdef StormByte_Shellcoder_EXPORTS
		#define STORMBYTE_SHELLCODER_PUBLIC	__declspec(dllexport)
	#else
		#define STORMBYTE_SHELLCODER_PUBLIC	__declspec(dllimport)
	#endif
	#define STORMBYTE_SHELLCODER_PRIVATE
#else
	#define STORMBYTE_SHELLCODER_PUBLIC		__attribute__ ((visibility ("default")))
	#define STORMBYTE_SHELLCODER_PRIVATE	__attribute__ ((visibility ("hidden")))
#endif
