#pragma once

/*here you can choose the text content backend*/

#define TB_BACKEND_STRING 1
#define TB_BACKEND_GAP    2

#ifndef TB_BACKEND
#define TB_BACKEND TB_BACKEND_GAP
#endif

/*undo grouping*/
#ifndef TB_GROUPING_TIMEOUT_MS
#define TB_GROUPING_TIMEOUT_MS 1000
#endif

#ifndef TB_MAX_UNDO_GROUPS
#define TB_MAX_UNDO_GROUPS 100
#endif

/*editor closes the open undo group after this much input inactivity*/
#ifndef TB_IDLE_FINALIZE_MS
#define TB_IDLE_FINALIZE_MS 1000
#endif

#ifndef TB_WRITE_CHUNK_SIZE
#define TB_WRITE_CHUNK_SIZE (64 * 1024)
#endif
