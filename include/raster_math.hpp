#pragma once
#include <algorithm>
#include <cmath>

namespace rmx {

struct ivec2 { int x{}, y{}; };

struct vec2 {
    double x{}, y{};
    vec2() = default;
    vec2(double X,double Y):x(X),y(Y){}
    vec2(const ivec2& p):x(double(p.x)),y(double(p.y)){}
};

inline bool operator==(const ivec2&a,const ivec2&b){ return a.x==b.x && a.y==b.y; }
inline bool operator<(const ivec2&a,const ivec2&b){ return a.x<b.x || (a.x==b.x && a.y<b.y); }

inline vec2 operator+(const vec2&a,const vec2&b){ return {a.x+b.x,a.y+b.y}; }
inline vec2 operator-(const vec2&a,const vec2&b){ return {a.x-b.x,a.y-b.y}; }
inline vec2 operator*(const vec2&a,double s){ return {a.x*s,a.y*s}; }

inline vec2 lerp(const vec2&a,const vec2&b,double t){ return a + (b-a)*t; }

// half away from zero: -2.5 -> -3
inline int roundAway(double v){ return int(std::round(v)); }
// half towards +inf: -2.5 -> -2
inline int roundHalfUp(double v){ return int(std::floor(v + 0.5)); }

inline ivec2 roundAway(const vec2&p){ return {roundAway(p.x), roundAway(p.y)}; }

// floor-based split, valid for negative values too
inline int    ipart (double v){ return int(std::floor(v)); }
inline double fpart (double v){ return v - std::floor(v); }
inline double rfpart(double v){ return 1.0 - fpart(v); }

inline double clamp01(double v){ return std::clamp(v, 0.0, 1.0); }

}
