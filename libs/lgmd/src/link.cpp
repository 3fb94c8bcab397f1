#include "lgtools/lgmd.h"

#include <algorithm>
#include <format>

namespace lgtools::lgmd {

namespace {

class Linker {
public:
    Linker(Model& model, LinkReport& report)
        : objects_(model.objects), report_(report) {}

    // walk follows object p's first child and that child's sibling chain.
    // The chain stops at -1, at an index outside the table, at a node it
    // already visited, or after one step per object.
    void walk(int p) {
        const int n = static_cast<int>(objects_.size());
        std::vector<bool> seen(objects_.size(), false);
        int c = objects_[static_cast<size_t>(p)].child;
        for (int steps = 0; c != -1 && steps < n; ++steps) {
            if (c < 0 || c >= n) {
                warn(std::format("object {}: link to {} is outside the object table", p, c));
                return;
            }
            if (seen[static_cast<size_t>(c)]) {
                warn(std::format("object {}: sibling chain loops back to {}", p, c));
                return;
            }
            seen[static_cast<size_t>(c)] = true;
            claim(p, c);
            c = objects_[static_cast<size_t>(c)].sibling;
        }
    }

private:
    std::vector<SubObject>& objects_;
    LinkReport& report_;

    void warn(std::string msg) { report_.warnings.push_back(std::move(msg)); }

    // is_ancestor reports whether a appears on the parent path of b
    // (b itself included).
    bool is_ancestor(int a, int b) const {
        int x = b;
        for (size_t steps = 0; x != -1 && steps <= objects_.size(); ++steps) {
            if (x == a) return true;
            x = objects_[static_cast<size_t>(x)].parent;
        }
        return false;
    }

    void claim(int p, int c) {
        auto& child = objects_[static_cast<size_t>(c)];
        if (child.parent == p) return;
        if (child.parent != -1) {
            warn(std::format("object {}: already a child of {}, ignoring link from {}",
                             c, child.parent, p));
            return;
        }
        if (is_ancestor(c, p)) {
            warn(std::format("object {}: link to {} would form a cycle", p, c));
            return;
        }
        child.parent = p;
        objects_[static_cast<size_t>(p)].children.push_back(c);
    }
};

bool touches_range(const Polygon& poly, uint32_t first, uint32_t end) {
    return std::any_of(poly.points.begin(), poly.points.end(),
                       [first, end](uint16_t p) { return p >= first && p < end; });
}

} // namespace

LinkReport link_objects(Model& model) {
    LinkReport report;

    for (auto& obj : model.objects) {
        obj.parent = -1;
        obj.children.clear();
        obj.polygons.clear();
    }

    Linker linker(model, report);
    for (size_t i = 0; i < model.objects.size(); ++i)
        linker.walk(static_cast<int>(i));

    report.roots = static_cast<size_t>(std::count_if(
        model.objects.begin(), model.objects.end(),
        [](const SubObject& o) { return o.parent == -1; }));

    // Point ranges are disjoint by convention; the first matching object owns
    // the polygon.
    for (size_t pi = 0; pi < model.polygons.size(); ++pi) {
        const auto& poly = model.polygons[pi];
        auto owner = std::find_if(model.objects.begin(), model.objects.end(),
                                  [&poly](const SubObject& o) {
                                      const uint32_t first = o.first_point;
                                      return touches_range(poly, first, first + o.num_points);
                                  });
        if (owner == model.objects.end()) {
            ++report.unassigned_polygons;
            continue;
        }
        owner->polygons.push_back(static_cast<uint32_t>(pi));
    }

    return report;
}

} // namespace lgtools::lgmd
