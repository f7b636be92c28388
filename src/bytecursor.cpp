/**
 * @file bytecursor.cpp
 * @brief ByteCursor compilation unit.
 *
 * The ByteCursor class is implemented entirely in the header so that the
 * per-byte reads inline into the decoder's dispatch loop. This file checks
 * that the header compiles on its own and gives the static library a
 * translation unit for it.
 *
 * @see include/msgjson/bytecursor.hpp for the full implementation
 */

#include <msgjson/bytecursor.hpp>

// All implementation is in the header (inline functions)
