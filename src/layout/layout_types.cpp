// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "layout_types.h"

namespace kale {

void KeyProperties::apply_patch(const KeyProperties& patch) {
    // Persistent: keep the running value unless the patch sets it
    if (patch.c) {
        c = patch.c;
    }
    if (patch.t) {
        t = patch.t;
    }
    if (patch.g) {
        g = patch.g;
    }
    if (patch.a) {
        a = patch.a;
    }
    if (patch.f) {
        f = patch.f;
    }
    if (patch.f2) {
        f2 = patch.f2;
    }
    if (patch.p) {
        p = patch.p;
    }

    // Transient: the patch replaces whatever was pending
    x = patch.x;
    y = patch.y;
    w = patch.w;
    h = patch.h;
    x2 = patch.x2;
    y2 = patch.y2;
    w2 = patch.w2;
    h2 = patch.h2;
    l = patch.l;
    n = patch.n;
    d = patch.d;
    r = patch.r;
    rx = patch.rx;
    ry = patch.ry;
}

void KeyProperties::clear_transient() {
    x.reset();
    y.reset();
    w.reset();
    h.reset();
    x2.reset();
    y2.reset();
    w2.reset();
    h2.reset();
    l.reset();
    n.reset();
    d.reset();
    r.reset();
    rx.reset();
    ry.reset();
}

std::vector<std::string> split_legends(const std::string& legend) {
    std::vector<std::string> legends;
    size_t start = 0;
    while (true) {
        size_t pos = legend.find(LEGEND_SEPARATOR, start);
        if (pos == std::string::npos) {
            legends.push_back(legend.substr(start));
            break;
        }
        legends.push_back(legend.substr(start, pos - start));
        start = pos + 1;
    }
    return legends;
}

std::string join_legends(const std::vector<std::string>& legends) {
    std::string joined;
    for (size_t i = 0; i < legends.size(); ++i) {
        if (i > 0) {
            joined += LEGEND_SEPARATOR;
        }
        joined += legends[i];
    }
    return joined;
}

} // namespace kale
