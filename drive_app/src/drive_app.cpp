// drive_app/src/drive_app.cpp
#include "common/app_pch.h"
#include "drive_app.h"


namespace Drive {

    DriveApp::DriveApp()
        : DriveApp(AppSpecification{}) {
    }

    DriveApp::DriveApp(const AppSpecification& appSpec)
        : m_appSpec(appSpec)
        , m_window(std::make_unique<GlfwWindow>(
            m_appSpec.windowSpec,
            m_appSpec.name))
        , m_physicsWorld(std::make_unique<PhysicsWorld>())
    {
        m_physicsWorld->initPhysx(m_appSpec.physicsThreads);
        spdlog::info("Window: {}x{}, Name: \"{}\"",
            m_appSpec.windowSpec.width,
            m_appSpec.windowSpec.height,
            m_appSpec.name);
    }

    DriveApp::~DriveApp() {
        // Layers hold bodies owned by the world
        m_layers.clear();
        m_physicsWorld.reset();
    }

    void DriveApp::initialize() {

        setupInputCallbacks();

        for (auto& layer : m_layers) {
            layer->onInit();
        }

        spdlog::info("[App] Initialized, fixed step {:.4f}s", m_appSpec.fixedTimeStep);
    }

    void DriveApp::runApp()
    {
        if (m_layers.empty()) {
            spdlog::warn("DriveApp::runApp() called but no layers pushed");
            return;
        }

        using clock = std::chrono::high_resolution_clock;
        using duration_t = std::chrono::duration<double>;
        const double targetFrameTime = 1.0 / m_appSpec.targetFps;
        const double fixedStep = static_cast<double>(m_appSpec.fixedTimeStep);
        auto lastTime = clock::now();
        double accumulator = 0.0;

        while (!m_window->isWindowShouldClose()) {

            m_window->pollEvents();
            processInput();

            // Nothing to drive while minimized
            int fbWidth = 0, fbHeight = 0;
            m_window->getFramebufferSize(fbWidth, fbHeight);

            if (fbWidth == 0 || fbHeight == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(16));
                lastTime = clock::now();
                continue;
            }
            // Compute delta time
            auto now = clock::now();
            double deltaTime = duration_t(now - lastTime).count();
            lastTime = now;

            accumulator += std::min(deltaTime, static_cast<double>(m_appSpec.maxFrameTime));

            // Layers shape forces, then the world integrates them
            while (accumulator >= fixedStep) {
                for (auto& layer : m_layers) {
                    layer->onFixedUpdate(m_appSpec.fixedTimeStep);
                }
                m_physicsWorld->stepSimulation(m_appSpec.fixedTimeStep);
                accumulator -= fixedStep;
            }
            m_interpolationAlpha = static_cast<float>(accumulator / fixedStep);

            for (auto& layer : m_layers) {
                layer->onUpdate(static_cast<float>(deltaTime));
            }

            // Frame cap sleep
            auto frameEnd = clock::now();
            double frameTime = duration_t(frameEnd - now).count();
            if (frameTime < targetFrameTime) {
                std::this_thread::sleep_for(std::chrono::duration<double>(targetFrameTime - frameTime));
            }
        }

        // Cleanup layers
        for (auto& layer : m_layers) {
            layer->onDetach();
        }
    }

    void DriveApp::setupInputCallbacks() {
        m_window->setKeyCallback([this](DriveKey key, int /*scancode*/, KeyAction action, int /*mods*/) {
            if (action == KeyAction::REPEAT) return;
            for (auto& layer : m_layers) {
                layer->onKeyEvent(key, action);
            }
            });
    }

    void DriveApp::processInput() {

        if (m_window && m_window->isKeyPressed(DriveKey::ESCAPE)) {
            m_window->requestWindowClose();
        }
    }

}
