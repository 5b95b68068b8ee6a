#pragma once

#include <algorithm>
#include <vector>

template <class T> class Observable;

/**
 * An observer which can be mixed in as a baseclass.  Implement onNotify as a method in your class.
 *
 * An observer may watch several observables; it detaches from all of them when destroyed.
 */
template <class T> class Observer
{
    std::vector<Observable<T> *> observed;

  public:
    Observer() = default;
    virtual ~Observer();

    Observer(const Observer &) = delete;
    Observer &operator=(const Observer &) = delete;

    /// Start watching a specified observable, watching the same one twice is a no-op
    void observe(Observable<T> *o);

    /// Stop watching the observable
    void unobserve(Observable<T> *o);

    bool isObserving(const Observable<T> *o) const
    {
        return std::find(observed.begin(), observed.end(), o) != observed.end();
    }

  private:
    friend class Observable<T>;

  protected:
    /**
     * returns 0 if other observers should continue to be called
     * returns !0 if the observe calls should be aborted and this result code returned for notifyObservers
     **/
    virtual int onNotify(T arg) = 0;
};

/**
 * An observer that calls an arbitrary method, so one class can watch several sources (banners, connection changes)
 */
template <class Callback, class T> class CallbackObserver : public Observer<T>
{
    typedef int (Callback::*ObserverCallback)(T arg);

    Callback *objPtr;
    ObserverCallback method;

  public:
    CallbackObserver(Callback *_objPtr, ObserverCallback _method) : objPtr(_objPtr), method(_method) {}

  protected:
    virtual int onNotify(T arg) override { return (objPtr->*method)(arg); }
};

/**
 * Fans an event out to its observers, in the order they started observing.
 *
 * Events are passed as pointers to objects owned by the notifier and are only valid for the duration of the call.
 * Observers may unobserve (themselves or others) from inside onNotify; those not yet called are then skipped.
 */
template <class T> class Observable
{
    std::vector<Observer<T> *> observers;

  public:
    Observable() = default;

    Observable(const Observable &) = delete;
    Observable &operator=(const Observable &) = delete;

    ~Observable()
    {
        // Observers outliving us must not try to unregister later
        for (auto o : observers)
            o->observed.erase(std::remove(o->observed.begin(), o->observed.end(), this), o->observed.end());
    }

    /**
     * Tell all observers about a change, observers can process arg as they wish
     *
     * returns !0 if an observer chose to abort processing by returning this code
     */
    int notifyObservers(T arg)
    {
        const std::vector<Observer<T> *> snapshot = observers;
        for (auto o : snapshot) {
            if (std::find(observers.begin(), observers.end(), o) == observers.end())
                continue; // unobserved by an earlier callback
            int result = o->onNotify(arg);
            if (result != 0)
                return result;
        }
        return 0;
    }

    size_t observerCount() const { return observers.size(); }

  private:
    friend class Observer<T>;

    // Not called directly, instead call observer.observe
    void addObserver(Observer<T> *o) { observers.push_back(o); }

    void removeObserver(Observer<T> *o) { observers.erase(std::remove(observers.begin(), observers.end(), o), observers.end()); }
};

template <class T> Observer<T>::~Observer()
{
    for (auto o : observed)
        o->removeObserver(this);
    observed.clear();
}

template <class T> void Observer<T>::observe(Observable<T> *o)
{
    if (isObserving(o))
        return;
    observed.push_back(o);
    o->addObserver(this);
}

template <class T> void Observer<T>::unobserve(Observable<T> *o)
{
    o->removeObserver(this);
    observed.erase(std::remove(observed.begin(), observed.end(), o), observed.end());
}
