#pragma once

/*compile-time defaults, override with -D on the compiler command line*/

#ifndef SLATE_DEFAULT_TAB_WIDTH
#define SLATE_DEFAULT_TAB_WIDTH 4
#endif

#ifndef SLATE_WRITE_CHUNK_SIZE
#define SLATE_WRITE_CHUNK_SIZE (1 << 16)
#endif

#ifndef SLATE_RC_NAME
#define SLATE_RC_NAME ".slaterc"
#endif

#define SLATE_DEBUG_LOG_ENV "SLATE_DEBUG_LOG"
