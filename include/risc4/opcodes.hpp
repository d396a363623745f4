#pragma once
#include <cstdint>

#include "risc4/opcodes.h"

namespace risc4
{

/** Primary opcode set (bits 15..12). */
enum class Op : std::uint8_t
{
#define OP(name, val, _) name = val,
#include "risc4/opcodes.def"
#undef OP
};

enum class Format : std::uint8_t
{
  Illegal = R4_FMT_ILLEGAL,
  R = R4_FMT_R,
  I = R4_FMT_I,
  X = R4_FMT_X,
  M = R4_FMT_M,
  B = R4_FMT_B,
  J = R4_FMT_J,
};

enum class Mn : std::uint8_t
{
  ILLEGAL = R4_MN_ILLEGAL,
#define MN(name, op, sub, fmt) name = R4_MN_##name,
#include "risc4/mnemonics.def"
#undef MN
};

// -----------------------------------------------------------------------------
// Mnemonic entry definition
// -----------------------------------------------------------------------------
struct MnemonicEntry
{
  const char *name;
  std::uint8_t opcode;
  std::int8_t sub;  // selecting sub-field value, -1 if none
  Format format;
};

#define R4_FMT_TOKEN_R Format::R
#define R4_FMT_TOKEN_I Format::I
#define R4_FMT_TOKEN_X Format::X
#define R4_FMT_TOKEN_M Format::M
#define R4_FMT_TOKEN_B Format::B
#define R4_FMT_TOKEN_J Format::J

// -----------------------------------------------------------------------------
// Mnemonic table, indexed by r4_mn_t (entry 0 is the illegal placeholder)
// -----------------------------------------------------------------------------
static constexpr MnemonicEntry kMnemonicTable[] = {
    {"ILLEGAL", 0, -1, Format::Illegal},
#define MN(name, op, sub, fmt) {#name, op, sub, R4_FMT_TOKEN_##fmt},
#include "risc4/mnemonics.def"
#undef MN
};

static_assert(sizeof(kMnemonicTable) / sizeof(kMnemonicTable[0]) == R4_MN_COUNT,
              "mnemonic table out of sync with r4_mn_t");

/** Primary format of each opcode, indexed by opcode value. */
static constexpr Format kOpFormat[16] = {
#define OP(name, val, fmt) R4_FMT_TOKEN_##fmt,
#include "risc4/opcodes.def"
#undef OP
};

inline const MnemonicEntry &mnemonic_entry(Mn mn)
{
  const unsigned idx = static_cast<unsigned>(mn);
  return idx < R4_MN_COUNT ? kMnemonicTable[idx] : kMnemonicTable[0];
}

}  // namespace risc4
