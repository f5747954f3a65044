#pragma once
#include <easel/path/path.h>
#include <optional>
#include <vector>

namespace easel::path {

// Path construction capability consumed by the canvas layer.
class GenericPathBuilder {
public:
    virtual ~GenericPathBuilder() = default;

    virtual void arc(Point origin, float radius, float start_angle, float end_angle,
                     bool anticlockwise) = 0;
    virtual void bezier_curve_to(Point control_point1, Point control_point2,
                                 Point control_point3) = 0;
    virtual void close() = 0;
    virtual void ellipse(Point origin, float radius_x, float radius_y, float rotation_angle,
                         float start_angle, float end_angle, bool anticlockwise) = 0;
    virtual std::optional<Point> get_current_point() const = 0;
    virtual void line_to(Point point) = 0;
    virtual void move_to(Point point) = 0;
    virtual void quadratic_curve_to(Point control_point, Point end_point) = 0;
    virtual void rect(const Rect& rect) = 0;

    // Consumes the builder. Returns nullopt when nothing drawable was
    // recorded; throws core::Error(BuilderFinished) on a second call.
    virtual std::optional<Path> finish() = 0;
};

struct ArcSweep {
    float start = 0;  // possibly wrapped start angle
    float sweep = 0;  // signed; negative is anticlockwise
};

// Canvas arc direction rules, including the full-circle special case.
ArcSweep compute_arc_sweep(float start_angle, float end_angle, bool anticlockwise);

class PathBuilder : public GenericPathBuilder {
public:
    PathBuilder() = default;

    void arc(Point origin, float radius, float start_angle, float end_angle,
             bool anticlockwise) override;
    void bezier_curve_to(Point control_point1, Point control_point2,
                         Point control_point3) override;
    void close() override;
    void ellipse(Point origin, float radius_x, float radius_y, float rotation_angle,
                 float start_angle, float end_angle, bool anticlockwise) override;
    std::optional<Point> get_current_point() const override;
    void line_to(Point point) override;
    void move_to(Point point) override;
    void quadratic_curve_to(Point control_point, Point end_point) override;
    void rect(const Rect& rect) override;
    std::optional<Path> finish() override;

    void push_path(const Path& path);
    bool is_finished() const { return finished_; }

private:
    void ensure_not_finished(const char* operation) const;
    void inject_move_to_if_needed(Point fallback);

    std::vector<PathVerb> verbs_;
    std::vector<Point> points_;
    size_t last_move_to_index_ = 0;
    bool move_to_required_ = true;
    bool finished_ = false;
};

} // namespace easel::path
