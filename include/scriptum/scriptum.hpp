// ============================================================================
// Scriptum - Main Include Header
// ============================================================================
// Include this single header to access all Scriptum functionality.
// ============================================================================

#ifndef SCRIPTUM_SCRIPTUM_HPP
#define SCRIPTUM_SCRIPTUM_HPP

// Core types and utilities
#include "scriptum/types.hpp"
#include "scriptum/version.hpp"
#include "scriptum/utf8.hpp"

// Vigenère pipeline
#include "scriptum/text_normalizer.hpp"
#include "scriptum/key_validator.hpp"
#include "scriptum/key_expander.hpp"
#include "scriptum/cipher_engine.hpp"
#include "scriptum/key_material.hpp"

// Files
#include "scriptum/text_file.hpp"
#include "scriptum/file_cipher.hpp"

#endif // SCRIPTUM_SCRIPTUM_HPP
