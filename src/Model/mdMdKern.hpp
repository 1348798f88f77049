// Created by Unium on 03.03.26

#pragma once

#include "../Tensor/mtTnTnsr.hpp"
#include <cstdint>
#include <vector>

namespace MD {
struct SAttnShape {
    int32_t iNHeads = 0;
    int32_t iNKvHeads = 0;
    int32_t iHeadDim = 0;
};

/*---------------------------------------------------------
 * FN: ApplyRopeRows
 * DESC: applies rotary position embeddings in-place to every
 *       head of every row, row r sits at lPosStart + r
 *       (llama rotate-half layout)
 * PARMS: tX ([n, heads * head_dim]), iNHeads, iHeadDim,
 *        lPosStart (position of row 0), fTheta (rope base)
 * AUTH: unium (25.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
void ApplyRopeRows(MT::CTensor &tX, int32_t iNHeads, int32_t iHeadDim, int64_t lPosStart, float fTheta);

/*---------------------------------------------------------
 * FN: CausalSpans
 * DESC: key spans for causal self attention over absolute
 *       positions, query p sees [p - window + 1, p]. window 0
 *       means the whole prefix
 * PARMS: lPosStart (position of query row 0), lRows (query
 *        rows), iWindow, vlBegin/vlEnd (out, one per row)
 * AUTH: unium (03.03.26)
 *-------------------------------------------------------*/
void CausalSpans(int64_t lPosStart, int64_t lRows, int32_t iWindow, std::vector<int64_t> &vlBegin,
                 std::vector<int64_t> &vlEnd);

/*---------------------------------------------------------
 * FN: SpanAttention
 * DESC: grouped query attention where query row r attends
 *       keys [vlBegin[r], vlEnd[r]). an empty span gives a zero
 *       row. covers windowed causal self attention and the
 *       prefix masked cross attention onto patches
 * PARMS: tQ ([n, heads * hd]), tK/tV ([m, kv_heads * hd]),
 *        sShape (head layout), vlBegin/vlEnd (spans per row)
 * AUTH: unium (25.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
auto SpanAttention(const MT::CTensor &tQ, const MT::CTensor &tK, const MT::CTensor &tV, const SAttnShape &sShape,
                   const std::vector<int64_t> &vlBegin, const std::vector<int64_t> &vlEnd) -> MT::CTensor;

/*---------------------------------------------------------
 * FN: SwiGlu
 * DESC: w2(silu(w1 x) * w3 x), the qwen2 mlp
 * PARMS: tX ([n, dim]), tW1 (gate), tW3 (up), tW2 (down)
 * AUTH: unium (25.02.26 R: 03.03.26)
 *-------------------------------------------------------*/
auto SwiGlu(const MT::CTensor &tX, const MT::CTensor &tW1, const MT::CTensor &tW3, const MT::CTensor &tW2)
    -> MT::CTensor;
} // namespace MD
