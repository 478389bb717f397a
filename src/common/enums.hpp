#pragma once

namespace tunelog {

enum class RunMode {
    Apply,
    Rollback
};

enum class PhaseState {
    NotStarted,
    Running,
    Succeeded,
    Failed,
    TimedOut
};

enum class ServiceStatus {
    Running,
    Stopped,
    Paused,
    StartPending,
    StopPending,
    Unknown
};

enum class StartupType {
    Automatic,
    AutomaticDelayed,
    Manual,
    Disabled,
    Boot,
    System
};

enum class RegistryValueKind {
    DWord,
    QWord,
    String,
    ExpandString
};

enum class RunnerKind {
    Native,
    PowerShell
};

} // namespace tunelog
