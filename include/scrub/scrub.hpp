#pragma once

/**
 * Scrub - Rectangular region inpainting for RGBA pixel buffers
 *
 * Usage:
 *
 *   #include <scrub/scrub.hpp>
 *   scrub::Pixmap pm = scrub::decodeNetpbm("photo.ppm");
 *   auto sel = scrub::Selection::AutoDetect(pm.width(), pm.height());
 *   scrub::inpaint(pm, sel);
 *   scrub::encodeNetpbm(pm, "photo_clean.ppm");
 *
 *   // Reproducible output
 *   scrub::StdRandom rng(42);
 *   scrub::InpaintContext ctx;
 *   ctx.random = &rng;
 *   scrub::inpaint(pm, sel, {}, ctx);
 */

// Version
#include "scrub/version.hpp"

// Core types
#include "scrub/types.hpp"

// Pixel data
#include "scrub/pixmap.hpp"

// Image (immutable pixel snapshot)
#include "scrub/image.hpp"

// Inputs
#include "scrub/selection.hpp"
#include "scrub/options.hpp"
#include "scrub/random.hpp"
#include "scrub/checkpoint.hpp"

// Pipeline building blocks
#include "scrub/texture_bank.hpp"
#include "scrub/distance_field.hpp"
#include "scrub/stages.hpp"

// Strategy and entry point
#include "scrub/inpainter.hpp"

// File I/O and batching
#include "scrub/netpbm.hpp"
#include "scrub/batch.hpp"
