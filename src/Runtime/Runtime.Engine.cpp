module;
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <utility>

#include <entt/entity/registry.hpp>

module Runtime:Engine.Impl;
import :Engine;
import :FrameController;
import Core;
import Graphics;
import Physics;
import ECS;
import XR;

namespace Runtime
{
    namespace
    {
        // States in which the runtime expects the frame loop to run.
        bool IsFrameLoopState(XR::SessionState state)
        {
            switch (state)
            {
                case XR::SessionState::Ready:
                case XR::SessionState::Synchronized:
                case XR::SessionState::Visible:
                case XR::SessionState::Focused:
                    return true;
                default:
                    return false;
            }
        }
    }

    Engine::Engine(const EngineConfig& config, const EngineServices& services)
        : m_Config(config), m_Services(services)
    {
        Core::Log::Info("Initializing {}...", m_Config.AppName);

        if (m_Services.ArenaBackend.GetFramesInFlight() != m_Config.FramesInFlight)
        {
            Core::Log::Error("FATAL: arena backend has {} frames in flight, engine is configured for {}",
                             m_Services.ArenaBackend.GetFramesInFlight(), m_Config.FramesInFlight);
            m_Valid = false;
            return;
        }

        m_Physics = std::make_unique<Physics::PhysicsWorld>(m_Config.World);
        if (!m_Physics->IsValid())
        {
            Core::Log::Error("FATAL: physics world initialization failed");
            m_Valid = false;
            return;
        }

        m_Arena = std::make_unique<Graphics::ResourceArena>(m_Services.ArenaBackend, m_Config.Arena);

        XR::SessionDriverConfig driverConfig;
        driverConfig.IdleSleep = m_Config.IdleSleep;
        m_SessionDriver = std::make_unique<XR::SessionDriver>(m_Services.XrRuntime, m_Services.Quit, driverConfig);

        FrameControllerConfig frameConfig;
        frameConfig.FramesInFlight = m_Config.FramesInFlight;
        frameConfig.FrameIndexWrap = m_Config.FrameIndexWrap;
        frameConfig.NearZ = m_Config.NearZ;
        frameConfig.FarZ = m_Config.FarZ;
        m_FrameController = std::make_unique<FrameController>(m_Services.XrRuntime, m_Services.Renderer, *m_Arena,
                                                              frameConfig);

        // Pick up whatever the runtime queued during its own startup.
        if (auto transition = Update(); !transition)
        {
            Core::Log::Error("FATAL: initial session poll failed: {}", Core::ErrorCodeToString(transition.error()));
            m_Valid = false;
            return;
        }

        m_LastTickTime = std::chrono::steady_clock::now();
        Core::Log::Info("Engine initialized");
    }

    Engine::~Engine()
    {
        // Entities reference bodies and meshes; drop them before the worlds go.
        m_Scene.GetRegistry().clear();
        Core::Log::Info("Engine shut down after {} ticks", m_TickCount);
    }

    void Engine::ProcessPlatformEvents()
    {
        for (XR::PlatformEvent event : m_Services.Platform.Poll())
        {
            switch (event)
            {
                case XR::PlatformEvent::Resume:
                    Core::Log::Info("Platform resumed");
                    m_Resumed = true;
                    break;
                case XR::PlatformEvent::Pause:
                    Core::Log::Info("Platform paused");
                    m_Resumed = false;
                    break;
                case XR::PlatformEvent::Destroy:
                    Core::Log::Info("Platform destroyed, requesting quit");
                    m_Services.Quit.Request();
                    break;
            }
        }
    }

    Core::Expected<XR::SessionTransition> Engine::Update()
    {
        if (!m_SessionDriver) return std::unexpected(Core::ErrorCode::InvalidState);

        ProcessPlatformEvents();

        auto transition = m_SessionDriver->Poll();
        if (!transition) return std::unexpected(transition.error());

        m_LastTransition = *transition;
        m_FrameController->SetSessionStates(transition->Previous, transition->Current);
        return transition;
    }

    Core::Expected<TickStatus> Engine::Tick()
    {
        Core::Profiling::ScopedTimer timer("Engine::Tick");

        auto status = AdvanceTick();
        // Requests never outlive the tick they were made in, rendered or not.
        m_Haptics.Reset();
        return status;
    }

    Core::Expected<TickStatus> Engine::AdvanceTick()
    {
        auto transition = Update();
        if (!transition) return std::unexpected(transition.error());
        if (transition->Action == XR::SessionAction::Shutdown) return TickStatus::Shutdown;

        ++m_TickCount;

        if (!m_Resumed)
        {
            // Paused activities get no frames; wake early on quit.
            m_Services.Quit.WaitFor(m_Config.IdleSleep);
            return TickStatus::Continue;
        }

        if (!m_SessionDriver->IsSessionRunning() || !IsFrameLoopState(transition->Current))
            return TickStatus::Continue;

        const auto now = std::chrono::steady_clock::now();
        const float deltaTime = std::chrono::duration<float>(now - m_LastTickTime).count();
        m_LastTickTime = now;

        OnUpdate(deltaTime);

        auto& registry = m_Scene.GetRegistry();
        if (auto stepped = m_Physics->Step(m_Config.FixedTimeStep); stepped)
        {
            ECS::Systems::RigidBodySync::OnUpdate(registry, *m_Physics);
        }
        else
        {
            Core::Log::Warn("Physics step failed ({}), keeping last poses",
                            Core::ErrorCodeToString(stepped.error()));
        }
        ECS::Systems::Transform::OnUpdate(registry);

        if (auto rendered = RenderFrame(); !rendered) return std::unexpected(rendered.error());

        if (auto applied = m_Haptics.Apply(m_Services.XrRuntime); !applied)
        {
            if (applied.error() == Core::ErrorCode::RuntimeTeardown) return std::unexpected(applied.error());
            Core::Log::Warn("Applying haptics failed: {}", Core::ErrorCodeToString(applied.error()));
        }

        return TickStatus::Continue;
    }

    Core::Result Engine::RenderFrame()
    {
        auto begun = m_FrameController->BeginFrame();
        if (!begun)
        {
            // The runtime frame may already be open; finish the handshake before bailing.
            if (m_FrameController->IsFrameOpen())
            {
                if (auto ended = m_FrameController->EndFrame(); !ended)
                    Core::Log::Error("Closing the failed frame: {}", Core::ErrorCodeToString(ended.error()));
            }
            return begun;
        }

        Core::Result built = Core::Ok();
        if (m_FrameController->GetPhase() == SubmissionPhase::Active)
        {
            built = m_FrameController->WriteSceneData(m_Lights);
            if (built)
            {
                auto draws = Graphics::Systems::DrawDataBuild::OnUpdate(m_Scene.GetRegistry(), *m_Arena);
                if (!draws) built = Core::Err(draws.error());
            }
        }

        auto ended = m_FrameController->EndFrame();

        if (!built)
        {
            if (Core::IsFatal(built.error()))
            {
                Core::Log::Error("FATAL: building frame {} failed: {}",
                                 m_FrameController->GetContext().FrameIndex, Core::ErrorCodeToString(built.error()));
                return built;
            }
            Core::Log::Warn("Frame {} built partially: {}", m_FrameController->GetContext().FrameIndex,
                            Core::ErrorCodeToString(built.error()));
        }
        return ended;
    }

    Core::Result Engine::Run(uint64_t maxTicks)
    {
        Core::Profiling::ScopedTimer timer("Engine::Run");

        if (!m_Valid)
        {
            Core::Log::Error("Engine failed to initialize, not running");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (m_LastTransition && m_LastTransition->Action == XR::SessionAction::Shutdown)
        {
            Core::Log::Info("Shutdown requested before the first tick");
            return Core::Ok();
        }

        OnStart();
        m_LastTickTime = std::chrono::steady_clock::now();

        for (uint64_t tick = 0; maxTicks == 0 || tick < maxTicks; ++tick)
        {
            auto status = Tick();
            if (!status)
            {
                if (status.error() == Core::ErrorCode::RuntimeTeardown)
                    Core::Log::Warn("XR runtime went away, stopping");
                else
                    Core::Log::Error("Stopping on error: {}", Core::ErrorCodeToString(status.error()));
                return Core::Err(status.error());
            }
            if (*status == TickStatus::Shutdown)
            {
                Core::Log::Info("Shutting down after {} ticks", m_TickCount);
                return Core::Ok();
            }
        }
        return Core::Ok();
    }
}
