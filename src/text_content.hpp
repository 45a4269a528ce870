#pragma once
/*
 * TextContent
 *
 * Purpose: pick the content backend used by TextBuffer and UndoRedoManager.
 * Note: switch with -DTB_BACKEND=TB_BACKEND_STRING|TB_BACKEND_GAP.
 */
#include "config.hpp"
#include "i_text_content_core.hpp"
#if TB_BACKEND == TB_BACKEND_STRING
#include "string_content_core.hpp"
using TextContent = StringContentCore;
#else
#include "gap_content_core.hpp"
using TextContent = GapContentCore;
#endif

static_assert(TextContentCRTPConcept<TextContent>, "Selected backend must satisfy CRTP concept");
