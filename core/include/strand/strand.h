#pragma once

// Strand - Main header
// Lines and trails built from chains of billboards and pipes

#include <strand/color.h>
#include <strand/curve.h>
#include <strand/gradient.h>
#include <strand/chain_style.h>
#include <strand/param.h>
#include <strand/draw_buffer.h>
#include <strand/mesh_chain.h>
#include <strand/chain_driver.h>
#include <strand/line_driver.h>
#include <strand/trail_driver.h>
#include <strand/chain_renderer.h>
#include <strand/frame_scheduler.h>
#include <strand/preset.h>

#define STRAND_VERSION_MAJOR 0
#define STRAND_VERSION_MINOR 1
#define STRAND_VERSION_PATCH 0

namespace strand {

inline const char* versionString() {
    return "0.1.0";
}

} // namespace strand
