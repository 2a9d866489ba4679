#include "common/cancellation.hpp"

namespace verifier {
using namespace std;

cancellation_token::cancellation_token()
    : s(make_shared<state>()) {}

cancellation_token::cancellation_token(shared_ptr<state> s)
    : s(move(s)) {}

void cancellation_token::cancel() const {
    s->cancelled = true;
}

bool cancellation_token::is_cancelled() const {
    for (const state *cur = s.get(); cur; cur = cur->parent.get())
        if (cur->cancelled) return true;
    return false;
}

cancellation_token cancellation_token::child() const {
    auto next = make_shared<state>();
    next->parent = s;
    return cancellation_token(next);
}

}  // namespace verifier
