#pragma once

#include "LayerAction.h"
#include "pixel/PixelGrid.h"

#include <cstdint>

namespace Lmx::Transforms {

// All transforms rewrite `px` in place; px.size() == size.count().

// Shift by `distance` pixels. No wraparound: vacated cells become black.
void scroll(PixelBuffer &px, MatrixSize size, ScrollDirection dir,
            int64_t distance);

// One quarter turn. Non-square matrices use the flat-index mapping
// (x,y) -> (h-1-y, x) [CW] or (y, w-1-x) [CCW] written at ny*w+nx;
// anything landing outside the buffer is dropped.
void rotateQuarter(PixelBuffer &px, MatrixSize size, RotateMode mode);

void mirror(PixelBuffer &px, MatrixSize size, MirrorAxis axis);

void invert(PixelBuffer &px);

void colourCycle(PixelBuffer &px, ColourCycleMode mode);

// Cells before `position` along the travel direction keep full colour,
// the rest fade linearly towards the far edge.
void wipe(PixelBuffer &px, MatrixSize size, WipeMode mode, int64_t position);

// First `position` columns/rows from `edge` are kept, the rest go black.
void reveal(PixelBuffer &px, MatrixSize size, RevealEdge edge,
            int64_t position);

// Applies one action at local step `step`.
void apply(PixelBuffer &px, MatrixSize size, const LayerAction &action,
           int64_t step);

} // namespace Lmx::Transforms
