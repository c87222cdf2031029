#pragma once
#include <memory>
#include <string>
#include <vector>
#include "interfaces/layer_i.h"
#include "interfaces/window_i.h"
#include "common/glfw_window.h"
#include "physics/physics_world.h"


namespace Drive {

    struct AppSpecification {
        std::string name = "arcade_drive";
        WindowSpecification windowSpec;
        float fixedTimeStep = 1.f / 60.f;
        // Frame time above this is dropped so a stall cannot queue up physics steps
        float maxFrameTime = 0.25f;
        double targetFps = 240.0;
        int physicsThreads = 2;
    };

    class DriveApp {
    public:
        DriveApp();
        explicit DriveApp(const AppSpecification& appSpec);

        ~DriveApp();

        void initialize();
        void runApp();

        template<typename T, typename... Args>
        void pushLayer(Args&&... args) {
            static_assert(std::is_base_of<ILayer, T>::value, "T must derive from ILayer");
            auto layer = std::make_unique<T>(std::forward<Args>(args)...);
            // give layer a chance to access app services
            layer->onAttach(this);
            m_layers.push_back(std::move(layer));
        }

        IWindow& getWindow() { return *m_window; }
        PhysicsWorld& getPhysicsWorld() { return *m_physicsWorld; }
        const AppSpecification& getSpecification() const { return m_appSpec; }

        // Fraction of a fixed step left in the accumulator, for pose blending
        float getInterpolationAlpha() const { return m_interpolationAlpha; }

        void setupInputCallbacks();
        void processInput();

    private:
        AppSpecification                         m_appSpec;
        std::unique_ptr<GlfwWindow>              m_window;
        std::unique_ptr<PhysicsWorld>            m_physicsWorld;

        std::vector<std::unique_ptr<ILayer>>     m_layers;

        float                                    m_interpolationAlpha = 0.f;
    };

}
