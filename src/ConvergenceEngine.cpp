#include "ConvergenceEngine.h"
#include "AngularUnwrapper.h"
#include "Logger.h"
#include "TimeUtil.h"
#include <algorithm>
#include <cmath>
#include <sstream>

ConvergenceEngine::ConvergenceEngine(const EngineConfig& cfg, PhaseHistoryStore& store,
                                     AlertNotifier* notifier, AuditLog* audit)
    : cfg_(cfg),
      store_(store),
      notifier_(notifier),
      audit_(audit),
      fitter_(cfg.trend),
      validator_(cfg.validator),
      trigger_(cfg.trigger, cfg.validator.k),
      scorer_(cfg.confidence, cfg.validator.k) {}

std::string ConvergenceEngine::dataStatusToStr(DataStatus s) {
    switch (s) {
        case DataStatus::OK: return "OK";
        case DataStatus::STALE: return "STALE";
        case DataStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
    }
    return "INSUFFICIENT_DATA";
}

std::string ConvergenceEngine::alertText(const StatusRecord& st, const EtaRecord& eta,
                                         const std::optional<ConvergenceEvent>& event) {
    std::ostringstream msg;
    msg << "Phase gap convergence event: " << formatIsoUtc(st.asOfUtc);
    if (st.phaseGapDeg) msg << " | phase_gap_deg=" << *st.phaseGapDeg;
    if (st.gti) msg << " | gti=" << *st.gti;
    msg << " | confidence=" << st.confidence
        << " | samples_confirmed=" << st.samplesConfirmed;
    if (eta.eta.etaDays) msg << " | eta_days=" << *eta.eta.etaDays;
    if (event) {
        msg << " | verification=" << event->verification;
        if (event->predictedUtc) msg << " | predicted_utc=" << formatIsoUtc(*event->predictedUtc);
        if (event->predictionErrorHours) msg << " | prediction_error_hours=" << *event->predictionErrorHours;
    }
    return msg.str();
}

EvaluationReport ConvergenceEngine::evaluate(std::optional<double> clarity, int64_t nowUtc) {
    std::lock_guard<std::mutex> lk(evalMu_);
    try {
        HistorySnapshot snap = store_.snapshot();
        return runPipeline(*snap, clarity, nowUtc);
    } catch (const std::exception& e) {
        return skippedReport(e.what(), nowUtc);
    }
}

EvaluationReport ConvergenceEngine::skippedReport(const std::string& why, int64_t nowUtc) {
    trigger_.markSkipped();
    LOG_ERROR("evaluation cycle skipped: " + why);

    EvaluationReport rep;
    rep.skipped = true;
    EventState st = trigger_.read();
    {
        std::lock_guard<std::mutex> lk(recordMu_);
        if (lastStatus_) rep.status = *lastStatus_;
        if (lastEta_) rep.eta = *lastEta_;
        rep.status.asOfUtc = nowUtc;
        rep.status.isTriggered = st.isTriggered;
        rep.status.samplesConfirmed = st.samplesConfirmed;
        rep.status.cycleSkipped = true;
        rep.status.reason = "cycle skipped: " + why;
        lastStatus_ = rep.status;
    }
    return rep;
}

EvaluationReport ConvergenceEngine::runPipeline(const std::vector<Sample>& history,
                                                std::optional<double> clarity, int64_t nowUtc) {
    EvaluationReport rep;
    TriggerInputs in;
    in.asOfUtc = nowUtc;
    in.clarity = clarity;

    if (!history.empty()) {
        const Sample& latest = history.back();
        in.phaseGapDeg = AngularUnwrapper::wrapDegrees(latest.phaseDeg);
        in.dataAgeHours = double(nowUtc - latest.asOfUtc) / kSecondsPerHour;
    }

    // 趋势与 ETA
    FitOutcome fit = fitter_.fit(history);
    EtaRecord etaRec;
    etaRec.asOfUtc = nowUtc;
    if (fit.status == FitStatus::OK) {
        const TrendEstimate& est = *fit.estimate;
        etaRec.eta = projector_.project(est, nowUtc);
        etaRec.slopeRadPerDay = est.slopePerDay;
        etaRec.phiNowRad = est.phiNow;
        etaRec.nUsed = est.nUsed;

        slopeLog_.push_back(est.slopePerDay);
        while (slopeLog_.size() > cfg_.confidence.etaLogSize) slopeLog_.pop_front();
        if (etaRec.eta.etaDays && *etaRec.eta.etaDays < EtaProjector::kMaxEtaDays) {
            etaLog_.push_back(*etaRec.eta.etaDays);
            while (etaLog_.size() > cfg_.confidence.etaLogSize) etaLog_.pop_front();
        }
    } else {
        etaRec.eta = projector_.insufficient(fit.reason);
    }
    etaRec.stability = EtaProjector::assessStability(etaLog_, slopeLog_);

    // 事件对照用此前的预测; 没有时退回本次预测
    std::optional<int64_t> predictedUtc = lastPredictedUtc_;
    if (etaRec.eta.closing() && etaRec.eta.etaDays && *etaRec.eta.etaDays < EtaProjector::kMaxEtaDays) {
        int64_t instant = nowUtc + static_cast<int64_t>(std::llround(*etaRec.eta.etaDays * kSecondsPerDay));
        if (!predictedUtc) predictedUtc = instant;
        lastPredictedUtc_ = instant;
    }

    // 收敛持续性: 最近一段解缠相位
    size_t tail = std::min(history.size(), std::max(cfg_.trend.fallbackSamples, cfg_.validator.rankWindow));
    std::vector<double> recentDeg;
    recentDeg.reserve(tail);
    for (size_t i = history.size() - tail; i < history.size(); ++i) recentDeg.push_back(history[i].phaseDeg);
    AngularUnwrapper unwrapper;
    ValidationResult val = validator_.validate(unwrapper.unwrapDegrees(recentDeg));
    in.trendConfirmed = val.confirmed;
    in.samplesConfirmed = val.samplesConfirmed;
    in.fitClosing = etaRec.eta.closing();

    const EventState before = trigger_.read();
    TransitionResult tr = trigger_.evaluate(in);

    ConfidenceInputs ci;
    ci.clarity = clarity.value_or(0.0);
    ci.dispersion = scorer_.etaDispersion(etaLog_);
    ci.samplesConfirmed = val.samplesConfirmed;
    const double confidence = scorer_.score(ci);

    StatusRecord st;
    st.asOfUtc = nowUtc;
    st.isTriggered = tr.state.isTriggered;
    st.phaseGapDeg = in.phaseGapDeg;
    st.gti = clarity;
    st.confidence = confidence;
    if (etaRec.slopeRadPerDay) st.closingRateDegPerDay = -radToDeg(*etaRec.slopeRadPerDay);
    st.samplesConfirmed = val.samplesConfirmed;
    st.dataFreshHours = in.dataAgeHours;
    if (!tr.dataFresh) st.dataStatus = DataStatus::STALE;
    else if (fit.status != FitStatus::OK) st.dataStatus = DataStatus::INSUFFICIENT_DATA;
    else st.dataStatus = DataStatus::OK;
    st.reason = tr.reason;

    if (st.dataStatus == DataStatus::STALE) {
        std::string why;
        if (history.empty()) why = "no samples";
        else if (!clarity) why = "clarity unavailable";
        else if (in.dataAgeHours && *in.dataAgeHours < 0.0) why = "latest sample in the future";
        else why = "latest sample too old";
        LOG_WARN("stale data (" + why + "), trigger gated");
    }

    std::optional<ConvergenceEvent> event;
    if (tr.transitioned && tr.state.isTriggered && in.phaseGapDeg) {
        ConvergenceEvent ev;
        ev.eventUtc = nowUtc;
        ev.phaseGapDeg = *in.phaseGapDeg;
        ev.clarity = clarity;
        ev.predictedUtc = predictedUtc;
        if (predictedUtc) ev.predictionErrorHours = double(nowUtc - *predictedUtc) / kSecondsPerHour;
        bool confirmed = std::fabs(ev.phaseGapDeg) < kConfirmedGapDeg && clarity && *clarity > kConfirmedClarity;
        ev.verification = confirmed ? "CONFIRMED" : "PROBABLE";
        LOG_INFO("convergence event recorded: " + ev.verification);
        event = ev;
    }

    if (tr.alertEmitted) {
        std::string text = alertText(st, etaRec, event);
        LOG_INFO(text);
        if (notifier_ && !notifier_->sendMessage(text)) {
            LOG_ERROR("alert delivery failed");
        }
    }

    if (tr.transitioned && audit_) {
        AuditEntry e;
        e.asOfUtc = nowUtc;
        e.fromState = EventTrigger::stateName(before.isTriggered);
        e.toState = EventTrigger::stateName(tr.state.isTriggered);
        e.alertEmitted = tr.alertEmitted;
        e.phaseGapDeg = in.phaseGapDeg;
        e.slopeRadPerDay = etaRec.slopeRadPerDay;
        e.clarity = clarity;
        e.dataAgeHours = in.dataAgeHours;
        e.windowSize = fit.estimate ? fit.estimate->nWindow : 0;
        e.samplesConfirmed = val.samplesConfirmed;
        e.confidence = confidence;
        e.reason = tr.reason;
        if (event) {
            e.predictedUtc = event->predictedUtc;
            e.predictionErrorHours = event->predictionErrorHours;
            e.verificationStatus = event->verification;
        }
        audit_->record(e);
    }

    std::ostringstream dbg;
    dbg << "eval: state=" << EventTrigger::stateName(st.isTriggered)
        << " status=" << dataStatusToStr(st.dataStatus)
        << " eta=" << EtaProjector::statusToStr(etaRec.eta.status)
        << " confirmed=" << val.samplesConfirmed
        << " confidence=" << confidence;
    LOG_DEBUG(dbg.str());

    {
        std::lock_guard<std::mutex> lk(recordMu_);
        lastStatus_ = st;
        lastEta_ = etaRec;
        if (event) lastEvent_ = event;
    }

    rep.status = st;
    rep.eta = etaRec;
    rep.event = event;
    rep.alertEmitted = tr.alertEmitted;
    rep.transitioned = tr.transitioned;
    return rep;
}

std::optional<StatusRecord> ConvergenceEngine::latestStatus() const {
    std::lock_guard<std::mutex> lk(recordMu_);
    return lastStatus_;
}

std::optional<EtaRecord> ConvergenceEngine::latestEta() const {
    std::lock_guard<std::mutex> lk(recordMu_);
    return lastEta_;
}

std::optional<ConvergenceEvent> ConvergenceEngine::latestEvent() const {
    std::lock_guard<std::mutex> lk(recordMu_);
    return lastEvent_;
}
