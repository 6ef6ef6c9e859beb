#pragma once

namespace laurel::awards {

// Achievement keys shared by the award rules and every achievement sink. They
// must match the ids registered with the platform achievement service.
namespace achievement_ids {

inline constexpr const char* WipeoutProgress00 = "WipeoutProgress00";
inline constexpr const char* WipeoutProgress01 = "WipeoutProgress01";
inline constexpr const char* WipeoutProgress02 = "WipeoutProgress02";
inline constexpr const char* GameProgress01 = "GameProgress01";
inline constexpr const char* GameProgress02 = "GameProgress02";
inline constexpr const char* DisintegrationMad = "DisintegrationMad";
inline constexpr const char* OneHitWonderExploder = "OneHitWonderExploder";
inline constexpr const char* OneHitWonderDisintegrator = "OneHitWonderDisintegrator";
inline constexpr const char* PenguinLover = "PenguinLover";
inline constexpr const char* GoldProgress00 = "GoldProgress00";
inline constexpr const char* GoldProgress01 = "GoldProgress01";
inline constexpr const char* GoldProgress02 = "GoldProgress02";
inline constexpr const char* SpeedFreak01 = "SpeedFreak01";
inline constexpr const char* Einstein = "Einstein";
inline constexpr const char* SpinCycle = "SpinCycle";
inline constexpr const char* BombParty = "BombParty";
inline constexpr const char* FirstPickup = "FirstPickup";
inline constexpr const char* FirstAlarmGerbils = "FirstAlarmGerbils";
inline constexpr const char* ScoreProgress00 = "ScoreProgress00";
inline constexpr const char* ScoreProgress01 = "ScoreProgress01";

} // namespace achievement_ids

// Level names referenced by level-specific awards
namespace level_names {

inline constexpr const char* Collateral = "Collateral";
inline constexpr const char* BeDecisive = "BeDecisive";
inline constexpr const char* Sink = "Sink";
inline constexpr const char* Spooky = "Spooky";
inline constexpr const char* NewtonsGerbil = "NewtonsGerbil";
inline constexpr const char* TwoSeasons = "TwoSeasons";
inline constexpr const char* BadNeighbors = "BadNeighbors";

} // namespace level_names

} // namespace laurel::awards
