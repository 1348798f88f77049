// Created by Unium on 12.02.26

#pragma once

#include "mtTnTnsr.hpp"
#include <cstdint>
#include <vector>

namespace MT {
namespace OP {
// <<<s_start(linear)
// --- projections
/*---------------------------------------------------------
 * FN: Linear
 * DESC: y = x @ W^T + b, the nn.Linear layout. rows of the
 *       output are split across the global pool
 * PARMS: tX (input [n, in]), tW (weight [out, in]),
 *        tB (bias [out], empty tensor for none)
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
auto Linear(const CTensor &tX, const CTensor &tW, const CTensor &tB) -> CTensor;
auto Linear(const CTensor &tX, const CTensor &tW) -> CTensor;

/*---------------------------------------------------------
 * FN: fDot
 * DESC: dot product of two float spans
 * PARMS: pfA, pfB (spans), lN (length)
 * AUTH: unium (14.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
auto fDot(const float *pfA, const float *pfB, int64_t lN) -> float;
// >>>s_end(linear)

// <<<s_start(activation)
// --- activations / normalization
/*---------------------------------------------------------
 * FN: RmsNorm
 * DESC: root mean square normalization over the last dim
 *       with learned weight
 * PARMS: tX (input), tW (weight), fEps (epsilon)
 * AUTH: unium (14.02.26)
 *-------------------------------------------------------*/
auto RmsNorm(const CTensor &tX, const CTensor &tW, float fEps = 1e-5f) -> CTensor;

/*---------------------------------------------------------
 * FN: SoftmaxRowsInplace
 * DESC: softmax along the last dim, max subtracted first
 * PARMS: tA (tensor, modified)
 * AUTH: unium (13.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
void SoftmaxRowsInplace(CTensor &tA);

/*---------------------------------------------------------
 * FN: SiluMulInplace
 * DESC: tGate = silu(tGate) * tUp, the swiglu gate
 * PARMS: tGate (modified), tUp (same shape)
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
void SiluMulInplace(CTensor &tGate, const CTensor &tUp);
// >>>s_end(activation)

// <<<s_start(index)
// --- indexing
/*---------------------------------------------------------
 * FN: GatherRows
 * DESC: copies rows viIdx of tTable into a new [n, d]
 *       tensor, the embedding lookup
 * PARMS: tTable ([rows, d]), viIdx (row ids)
 * AUTH: unium (14.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
auto GatherRows(const CTensor &tTable, const std::vector<int32_t> &viIdx) -> CTensor;

/*---------------------------------------------------------
 * FN: SliceRange
 * DESC: extracts rows [lStart, lEnd) from dim 0 as a view
 * PARMS: tA (tensor), lStart (start idx), lEnd (end idx)
 * AUTH: unium (14.02.26)
 *-------------------------------------------------------*/
auto SliceRange(const CTensor &tA, int64_t lStart, int64_t lEnd) -> CTensor;
// >>>s_end(index)

// <<<s_start(ipo)
// --- in place opers
/*---------------------------------------------------------
 * FN: CopyInto
 * DESC: copies tSrc data into tDst at row offset
 *       used for KV cache updates without allocation
 * PARMS: tDst (destination), tSrc (source), lRowOffset (row)
 * AUTH: unium (14.02.26)
 *-------------------------------------------------------*/
void CopyInto(CTensor &tDst, const CTensor &tSrc, int64_t lRowOffset = 0);

void FillInplace(CTensor &tA, float fVal);

/*---------------------------------------------------------
 * FN: AddScaledInplace
 * DESC: tDst += fScale * tSrc, element wise. fScale = 1 is
 *       the plain residual add
 * PARMS: tDst (modified), tSrc (same numel), fScale
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
void AddScaledInplace(CTensor &tDst, const CTensor &tSrc, float fScale = 1.0f);
// >>>s_end(ipo)

// <<<s_start(check)
// --- checks
/*---------------------------------------------------------
 * FN: bAllFinite
 * DESC: true if no element is nan or inf
 * PARMS: tA (tensor)
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
auto bAllFinite(const CTensor &tA) -> bool;
// >>>s_end(check)
} // namespace OP
} // namespace MT
