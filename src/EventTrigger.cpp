#include "EventTrigger.h"
#include "Logger.h"
#include <cmath>
#include <sstream>

EventTrigger::EventTrigger(const TriggerConfig& cfg, int k) : cfg_(cfg), k_(k) {}

EventState EventTrigger::read() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

void EventTrigger::restore(const EventState& st) {
    std::lock_guard<std::mutex> lk(mu_);
    state_ = st;
    // 恢复为 CLOSING 时告警已经发过
    alertArmed_ = !st.isTriggered;
    lowClarityStreak_ = 0;
}

void EventTrigger::markSkipped() {
    std::lock_guard<std::mutex> lk(mu_);
    skipped_++;
}

int EventTrigger::skippedCycles() const {
    std::lock_guard<std::mutex> lk(mu_);
    return skipped_;
}

bool EventTrigger::isFresh(const TriggerInputs& in) const {
    if (!in.dataAgeHours || !in.phaseGapDeg || !in.clarity) return false;
    if (!std::isfinite(*in.dataAgeHours) || !std::isfinite(*in.phaseGapDeg) || !std::isfinite(*in.clarity)) return false;
    return *in.dataAgeHours >= -cfg_.futureToleranceHours && *in.dataAgeHours <= cfg_.freshnessHours;
}

TransitionResult EventTrigger::evaluate(const TriggerInputs& in) {
    std::lock_guard<std::mutex> lk(mu_);
    TransitionResult res;
    res.dataFresh = isFresh(in);
    state_.samplesConfirmed = in.samplesConfirmed;

    const bool clarityOk = in.clarity && *in.clarity >= cfg_.clarityMin;
    if (in.clarity && !clarityOk) lowClarityStreak_++;
    else if (clarityOk) lowClarityStreak_ = 0;

    std::ostringstream why;
    if (!state_.isTriggered) {
        const bool gapOk = in.phaseGapDeg && std::fabs(*in.phaseGapDeg) <= cfg_.enterDeg;
        if (gapOk && clarityOk && in.trendConfirmed && in.fitClosing && res.dataFresh) {
            state_.isTriggered = true;
            state_.since = in.asOfUtc;
            res.transitioned = true;
            why << "enter: |gap| <= " << cfg_.enterDeg << " deg, clarity >= " << cfg_.clarityMin
                << ", " << in.samplesConfirmed << " closing samples (k=" << k_ << "), data fresh";
            if (alertArmed_) {
                res.alertEmitted = true;
                alertArmed_ = false;
            }
        } else {
            if (!res.dataFresh) why << "stale data; ";
            if (!gapOk) why << "gap above enter threshold; ";
            if (!clarityOk) why << "clarity below threshold; ";
            if (!in.trendConfirmed) why << "closing trend not confirmed; ";
            if (!in.fitClosing) why << "fitted slope not closing; ";
            why << "remain OPEN";
        }
    } else {
        const bool gapWide = !in.phaseGapDeg || std::fabs(*in.phaseGapDeg) > cfg_.exitDeg;
        const bool clarityLost = lowClarityStreak_ >= cfg_.clarityExitEvaluations;
        if (gapWide || !res.dataFresh || clarityLost || !in.fitClosing) {
            state_.isTriggered = false;
            state_.since = in.asOfUtc;
            res.transitioned = true;
            alertArmed_ = true;
            lowClarityStreak_ = 0;
            why << "reset:";
            if (gapWide) why << " |gap| > " << cfg_.exitDeg << " deg";
            if (!res.dataFresh) why << " stale data";
            if (!in.fitClosing) why << " fitted slope not closing";
            if (clarityLost) why << " clarity below " << cfg_.clarityMin << " for " << cfg_.clarityExitEvaluations
                                 << " evaluations";
        } else {
            why << "remain CLOSING";
        }
    }

    res.reason = why.str();
    res.state = state_;
    if (res.transitioned) {
        LOG_INFO(std::string("event state -> ") + stateName(state_.isTriggered) + " (" + res.reason + ")");
    }
    return res;
}
