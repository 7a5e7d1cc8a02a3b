#pragma once

/*compile-time defaults, overridable with -D or at runtime via ~/.bufedrc*/

#ifndef BUFED_MAX_HISTORY
#define BUFED_MAX_HISTORY 100
#endif

#ifndef BUFED_TAB_SIZE
#define BUFED_TAB_SIZE 4
#endif

#ifndef BUFED_MAX_FILE_SIZE
#define BUFED_MAX_FILE_SIZE 10000000ULL
#endif

#ifndef BUFED_WRITE_CHUNK_SIZE
#define BUFED_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#ifndef BUFED_RC_FILE
#define BUFED_RC_FILE ".bufedrc"
#endif

#define BUFED_UNTITLED_PREFIX "*untitled-"
#define BUFED_BACKUP_SUFFIX ".backup"
