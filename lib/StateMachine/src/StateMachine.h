#pragma once

// system includes
#include <functional>
#include <map>
#include <vector>

// project includes
#include "fsm_debug.h"

// Alias for any callback with no args
using ActionFn = std::function<void()>;

// Transition descriptor
template <typename StateT, typename EventT> struct Transition {
  StateT from;
  EventT event;
  StateT to;
  ActionFn action;
};

// Table-driven state machine. A matching transition runs
// exit(from) -> action -> state change -> entry(to), so an exit hook always
// runs before anything the next state does.
template <typename StateT, typename EventT> class StateMachine {
public:
  explicit StateMachine(StateT init) : _current(init) {}

  void addTransition(const Transition<StateT, EventT> &t) {
    _transitions.push_back(t);
  }

  void setEntry(StateT s, ActionFn fn) {
    _entryMap[s] = fn;
  }
  void setExit(StateT s, ActionFn fn) {
    _exitMap[s] = fn;
  }

  // Returns true if a transition fired. Unknown (state, event) pairs are ignored.
  bool handleEvent(EventT ev) {
    for (const auto &t : _transitions) {
      if (t.from == _current && t.event == ev) {
        fire(t);
        return true;
      }
    }
    return false;
  }

  StateT getState() const {
    return _current;
  }

private:
  void fire(const Transition<StateT, EventT> &t) {
    runHook(_exitMap, _current);
    if (t.action)
      t.action();
    _current = t.to;
    runHook(_entryMap, _current);
    FSM_DBG_PRINTLN("StateMachine: event consumed");
  }

  // find() so dispatch never inserts into the hook maps
  static void runHook(const std::map<StateT, ActionFn> &hooks, StateT s) {
    auto it = hooks.find(s);
    if (it != hooks.end() && it->second)
      it->second();
  }

  StateT _current;
  std::vector<Transition<StateT, EventT>> _transitions;
  std::map<StateT, ActionFn> _entryMap;
  std::map<StateT, ActionFn> _exitMap;
};
