/// @file litdocx.hpp
/// @brief Umbrella header for the litdocx library.
///
/// Include this single header for access to the public API: the markup
/// tree, the markdown parser, the converter and its document model, the
/// numbering allocator, the OOXML writer, the archive and the pipeline.
/// JSON interop lives in <litdocx/json.hpp> and is not included here.

#pragma once

#include <litdocx/archive.hpp>
#include <litdocx/converter.hpp>
#include <litdocx/document.hpp>
#include <litdocx/error.hpp>
#include <litdocx/markdown.hpp>
#include <litdocx/markup.hpp>
#include <litdocx/numbering.hpp>
#include <litdocx/ooxml.hpp>
#include <litdocx/options.hpp>
#include <litdocx/pipeline.hpp>
#include <litdocx/run.hpp>
#include <litdocx/term_emphasis.hpp>
