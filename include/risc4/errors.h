#pragma once

/**
 * @file errors.h
 * @brief RISC-4 error codes for C
 *
 * C-compatible constants generated from errors.def
 */

#ifdef __cplusplus
extern "C"
{
#endif

#define ERR(name, val, msg) static const int R4_ERR_##name = val;
#include "risc4/errors.def"
#undef ERR

#ifdef __cplusplus
}
#endif
