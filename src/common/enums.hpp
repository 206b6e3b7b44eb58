#pragma once

namespace scorebook {

enum class HalfSide {
    Top,
    Bottom
};

// Home is used both as the batter's starting point and as the scoring target.
enum class Base {
    Home = 0,
    First = 1,
    Second = 2,
    Third = 3,
    Scored = 4
};

enum class PitchResult {
    Ball,
    Strike,
    Foul,
    InPlay
};

enum class PlayKind {
    Strikeout,
    Walk,
    HitByPitch,
    Single,
    Double,
    Triple,
    HomeRun,
    GroundOut,
    FlyOut,
    FieldersChoice,
    DoublePlay,
    TriplePlay,
    SacrificeFly,
    SacrificeBunt,
    Error,
    CatcherInterference,
    StolenBase,
    CaughtStealing,
    WildPitch,
    PassedBall,
    Balk,
    GenericOut
};

enum class BatterFate {
    Out,
    Reaches,
    NotInvolved
};

enum class AnomalyKind {
    UnrecognizedPlayPattern,
    IllegalAdvancement,
    InconsistentOutCount,
    ReportedTotalsMismatch,
    ContestedEarnedRuns,
    IncompleteGameData
};

} // namespace scorebook
