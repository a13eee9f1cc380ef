
#pragma once

namespace srx {

struct vec2 {
    float x{}, y{};
    vec2() = default;
    vec2(float X,float Y):x(X),y(Y){}
};

struct rect {
    float x{}, y{}, width{}, height{};
    rect() = default;
    rect(float X,float Y,float W,float H):x(X),y(Y),width(W),height(H){}
};

inline bool operator==(const vec2&a,const vec2&b){ return a.x==b.x && a.y==b.y; }
inline bool operator==(const rect&a,const rect&b){
    return a.x==b.x && a.y==b.y && a.width==b.width && a.height==b.height;
}

// exact comparison: drag-end velocity of (0,0) means "no momentum will follow"
inline bool isZero(const vec2& v){ return v.x==0.f && v.y==0.f; }

}
