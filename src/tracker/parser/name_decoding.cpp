/*Copyright (c) 2024 The DarkMatter Project
Licensed under the GNU General Public License 2.0.

name_decoding.cpp implementation.*/

#include "name_decoding.hpp"

#include "../../shared/string_utils.hpp"

#include <algorithm>
#include <array>
#include <span>

namespace sandstats::tracker {
namespace {

constexpr std::array<std::string_view, 4> kWeaponCategoryPrefixes{ "Firearm_", "Weapon_", "Melee_", "Projectile_" };
constexpr std::array<std::string_view, 3> kKnownModes{ "Checkpoint", "Push", "Skirmish" };
constexpr std::array<std::string_view, 2> kKnownSides{ "Security", "Insurgents" };

constexpr std::array<std::string_view, 12> kExplosiveMarkers{
	"grenade", "rocket", "rpg", "at4", "c4", "ied", "molotov",
	"mortar", "artillery", "explosive", "airstrike", "incendiary"
};
constexpr std::array<std::string_view, 6> kVehicleMarkers{
	"vehicle", "technical", "btr", "helicopter", "gunship", "apc"
};

void StripPrefix(std::string& text, std::string_view prefix) {
	if (std::string_view(text).starts_with(prefix))
		text.erase(0, prefix.size());
}

void StripSuffix(std::string& text, std::string_view suffix) {
	if (std::string_view(text).ends_with(suffix))
		text.erase(text.size() - suffix.size());
}

bool ContainsAny(std::string_view haystack, std::span<const std::string_view> needles) {
	return std::any_of(needles.begin(), needles.end(), [haystack](std::string_view needle) {
		return haystack.find(needle) != std::string_view::npos;
	});
}

bool IsKnown(std::string_view value, std::span<const std::string_view> known) {
	return std::find(known.begin(), known.end(), value) != known.end();
}

} // namespace

/*
=============
CleanWeaponName

Strips blueprint decoration from a weapon id. Steps run in a fixed order:
"BP_" prefix, numeric instance suffix, "_C" class suffix, category prefixes,
then underscores become spaces. Objective-destroy pseudo weapons collapse to
"ODCheckpoint".
=============
*/
std::string CleanWeaponName(std::string_view rawWeapon) {
	std::string weapon = Trim(rawWeapon);
	StripPrefix(weapon, "BP_");

	const size_t lastUnderscore = weapon.rfind('_');
	if (lastUnderscore != std::string::npos && lastUnderscore + 1 < weapon.size()) {
		const std::string_view suffix = std::string_view(weapon).substr(lastUnderscore + 1);
		const bool numeric = std::all_of(suffix.begin(), suffix.end(), [](char c) { return c >= '0' && c <= '9'; });
		if (numeric)
			weapon.erase(lastUnderscore);
	}

	StripSuffix(weapon, "_C");
	for (std::string_view prefix : kWeaponCategoryPrefixes)
		StripPrefix(weapon, prefix);

	std::replace(weapon.begin(), weapon.end(), '_', ' ');

	if (std::string_view(weapon).starts_with("ODCheckpoint "))
		weapon = "ODCheckpoint";

	return weapon;
}

std::string WeaponType(std::string_view rawWeapon) {
	std::string_view weapon = TrimView(rawWeapon);
	if (weapon.starts_with("BP_"))
		weapon.remove_prefix(3);

	return std::string(weapon.substr(0, weapon.find('_')));
}

bool IsExplosiveWeapon(std::string_view rawWeapon) {
	if (WeaponType(rawWeapon) == "Projectile")
		return true;

	return ContainsAny(ToLower(CleanWeaponName(rawWeapon)), kExplosiveMarkers);
}

bool IsVehicleWeapon(std::string_view rawWeapon) {
	return ContainsAny(ToLower(rawWeapon), kVehicleMarkers);
}

/*
=============
ExtractGameMode

Scenario ids read Scenario_<Map>_<Mode>[_<Side>]. Bare mode names pass through.
=============
*/
std::string ExtractGameMode(std::string_view scenario) {
	scenario = TrimView(scenario);
	if (scenario.empty())
		return "Unknown";
	if (IsKnown(scenario, kKnownModes))
		return std::string(scenario);

	if (scenario.starts_with("Scenario_"))
		scenario.remove_prefix(9);

	const auto parts = SplitView(scenario, '_');
	if (parts.size() < 2 || !IsKnown(parts[1], kKnownModes))
		return "Unknown";

	return std::string(parts[1]);
}

std::string ExtractSide(std::string_view scenario) {
	const auto parts = SplitView(TrimView(scenario), '_');
	if (parts.size() < 2)
		return {};

	const std::string_view last = parts.back();
	return IsKnown(last, kKnownSides) ? std::string(last) : std::string();
}

std::string NormalizePlatformId(std::string_view id) {
	id = TrimView(id);
	const size_t colon = id.rfind(':');
	if (colon != std::string_view::npos)
		id.remove_prefix(colon + 1);
	return std::string(id);
}

} // namespace sandstats::tracker
