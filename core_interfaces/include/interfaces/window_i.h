#pragma once
#include "global_common/key_codes.h"
#include <glm/glm.hpp>
#include <functional>
#include <string>


using DriveKeyCallback = std::function<void(DriveKey key, int scancode, KeyAction action, int mods)>;

struct IWindow {
	virtual ~IWindow() = default;
    virtual void getFramebufferSize(int& width, int& height) const = 0;
    virtual bool isKeyPressed(DriveKey key) const = 0;
    virtual bool isMouseButtonPressed(DriveMouseButton button) const = 0;
    virtual glm::vec2 getCursorPosition() const = 0;
    virtual void setKeyCallback(DriveKeyCallback callback) = 0;
    virtual void setTitle(const std::string& title) = 0;
    virtual bool isWindowShouldClose() const = 0;
    virtual void requestWindowClose() = 0;
    virtual void pollEvents() = 0;
};
