#pragma once
#include "global_common/key_codes.h"

namespace Drive { class DriveApp; }
struct ILayer {

	virtual void onAttach(Drive::DriveApp* app) { /* optional */ }
	virtual void onInit() = 0;
	// Runs once per physics step, before the world integrates
	virtual void onFixedUpdate(float fixedDt) = 0;
	virtual void onUpdate(float deltaTime) = 0;
	virtual void onKeyEvent(DriveKey key, KeyAction action) {}
	virtual void onDetach() = 0;
	virtual bool isAttached() = 0;
	virtual ~ILayer() = default;
};
