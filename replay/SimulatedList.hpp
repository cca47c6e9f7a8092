#pragma once

#include <cstdint>

#include "scroll/Element.hpp"
#include "helpers/memory/Memory.hpp"

class CSimulatedList;

// body / optional scroll container / the decorated list, laid out by CSimulatedList
class CSimElement : public IElement {
  public:
    enum eRole : uint8_t {
        ROLE_BODY = 0,
        ROLE_CONTAINER,
        ROLE_CONTENT,
    };

    CSimElement(WP<CSimulatedList> list, eRole role);

    virtual SP<IElement> parent();
    virtual eOverflow    overflowY();
    virtual CBox         boundingBox();
    virtual double       scrollTop();
    virtual void         scrollBy(double dy);
    virtual double       scrollHeight();
    virtual double       clientHeight();
    virtual bool         isDocumentRoot();

  private:
    WP<CSimulatedList> m_list;
    eRole              m_role = ROLE_CONTENT;
};

class CSimViewport : public IViewport {
  public:
    CSimViewport(WP<CSimulatedList> list);

    virtual double scrollY();
    virtual double innerHeight();
    virtual double documentHeight();
    virtual void   scrollBy(double dy);

  private:
    WP<CSimulatedList> m_list;
};

/*
    A fixed-height item list, either scrolled by the page or inside a container
    with overflow-y: auto when containerHeight > 0.
*/
class CSimulatedList {
  public:
    CSimulatedList() = default;

    // creates the element tree. Geometry changes after this are fine, containerHeight isn't.
    void          build();
    bool          built() const;

    double        contentHeight() const;
    double        maxScroll() const;

    // absolute, clamped to [0, maxScroll]
    void          scrollTo(double y);
    void          scrollBy(double dy);

    SP<IElement>  content() const;
    SP<IViewport> viewport() const;

    double        m_viewportHeight  = 600;
    double        m_containerHeight = 0;
    double        m_itemHeight      = 50;
    int64_t       m_items           = 0;
    int64_t       m_pageSize        = 10;
    // 0 = unlimited
    int64_t       m_totalItems = 0;

    // of the container, or the page
    double             m_scroll = 0;

    WP<CSimulatedList> m_self;

  private:
    SP<CSimElement>  m_body;
    SP<CSimElement>  m_container;
    SP<CSimElement>  m_content;
    SP<CSimViewport> m_viewport;

    friend class CSimElement;
    friend class CSimViewport;
};
