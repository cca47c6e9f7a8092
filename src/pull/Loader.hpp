#pragma once

#include <functional>

/*
    A caller-owned asynchronous load. load() only starts it; the caller reports
    the outcome through CPullToLoad::on{Top,Bottom}Loaded / on{Top,Bottom}LoadFailed.
*/
class ILoader {
  public:
    virtual ~ILoader() = default;

    virtual void load() = 0;
};

class CFunctionLoader : public ILoader {
  public:
    CFunctionLoader(std::function<void()> fn);
    virtual ~CFunctionLoader() = default;

    virtual void load();

  private:
    std::function<void()> m_fn;
};
