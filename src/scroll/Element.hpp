#pragma once

#include <cstdint>

#include "../helpers/math/Math.hpp"
#include "../helpers/memory/Memory.hpp"

enum eOverflow : uint8_t {
    OVERFLOW_VISIBLE = 0,
    OVERFLOW_HIDDEN,
    OVERFLOW_SCROLL,
    OVERFLOW_AUTO,
};

/*
    Geometry provider for one node of the host's element tree.
    Boxes are viewport-relative (what getBoundingClientRect() reports).
*/
class IElement {
  public:
    virtual ~IElement() = default;

    // nullptr at the top of the tree
    virtual SP<IElement> parent()         = 0;
    virtual eOverflow    overflowY()      = 0;
    virtual CBox         boundingBox()    = 0;
    virtual double       scrollTop()      = 0;
    virtual void         scrollBy(double dy) = 0;

    // height of the laid out children, can be less than clientHeight() when they don't fill it
    virtual double       scrollHeight()   = 0;
    // inner visible height
    virtual double       clientHeight()   = 0;

    // html / body. The ancestor walk never looks past these.
    virtual bool isDocumentRoot() = 0;
};

/*
    Geometry provider for the window / viewport.
*/
class IViewport {
  public:
    virtual ~IViewport() = default;

    virtual double scrollY()            = 0;
    virtual double innerHeight()        = 0;
    virtual double documentHeight()     = 0;
    virtual void   scrollBy(double dy)  = 0;
};
