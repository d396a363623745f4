#pragma once

// Error codes expanded from errors.def.
// Define ERR(name, val, msg) before including this file if you need a
// different expansion.

#ifndef ERR
#define ERR(name, val, msg) name = val,
#endif

enum class Err : int
{
#include "risc4/errors.def"
};

#undef ERR

// Error return helper for C-style call sites
#define R4_ERR(name) static_cast<r4_err>(Err::name)

inline const char *err_str(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return msg;
#include "risc4/errors.def"
#undef ERR
    default:
      return "unknown error";
  }
}

inline const char *err_name(Err e)
{
  switch (e)
  {
#define ERR(name, val, msg) \
  case Err::name:           \
    return #name;
#include "risc4/errors.def"
#undef ERR
    default:
      return "Unknown";
  }
}
