/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

name_decoding.hpp weapon and scenario name helpers.*/

#pragma once

#include <string>
#include <string_view>

namespace sandstats::tracker {

// "BP_Firearm_M4A1_C_2147480587" -> "M4A1"
std::string CleanWeaponName(std::string_view rawWeapon);

// "BP_Firearm_M4A1_C_2147480587" -> "Firearm"
std::string WeaponType(std::string_view rawWeapon);

bool IsExplosiveWeapon(std::string_view rawWeapon);
bool IsVehicleWeapon(std::string_view rawWeapon);

// "Scenario_Ministry_Checkpoint_Security" -> "Checkpoint"; "Unknown" otherwise.
std::string ExtractGameMode(std::string_view scenario);

// "Scenario_Ministry_Checkpoint_Security" -> "Security"; empty when absent.
std::string ExtractSide(std::string_view scenario);

// Platform ids are stored bare: "SteamNWI:7656..." -> "7656...".
std::string NormalizePlatformId(std::string_view id);

} // namespace sandstats::tracker
