module;
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

export module Runtime:Engine;

import :FrameController;
import Core;
import Graphics;
import Physics;
import ECS;
import XR;

export namespace Runtime
{
    struct EngineConfig
    {
        std::string AppName = "Meridian App";
        uint32_t FramesInFlight = 2;
        uint64_t FrameIndexWrap = 1u << 20;
        std::chrono::milliseconds IdleSleep{100};
        float FixedTimeStep = 1.0f / 90.0f;
        float NearZ = 0.05f;
        float FarZ = 100.0f;
        Graphics::ResourceArenaConfig Arena;
        Physics::WorldConfig World;
    };

    // Everything the engine talks to but does not own. The application picks
    // device-backed or headless implementations.
    struct EngineServices
    {
        XR::IXrRuntime& XrRuntime;
        XR::IPlatformEventSource& Platform;
        Graphics::IArenaBackend& ArenaBackend;
        Graphics::IFrameRenderer& Renderer;
        Core::QuitSignal& Quit;
    };

    enum class TickStatus : uint8_t
    {
        Continue,
        Shutdown
    };

    // -------------------------------------------------------------------------
    // Engine
    // -------------------------------------------------------------------------
    // One tick:
    //   platform events -> session poll -> OnUpdate -> physics step ->
    //   rigid body sync -> world transforms -> BeginFrame -> scene data +
    //   draw data -> submit -> EndFrame -> haptics
    // Frames only run while the session is running. ArenaFull and runtime
    // failures stop the loop with an error; shutdown is a normal return.
    // -------------------------------------------------------------------------
    class Engine
    {
    public:
        Engine(const EngineConfig& config, const EngineServices& services);
        virtual ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // False when a subsystem failed to initialize. Run() returns immediately.
        [[nodiscard]] bool IsValid() const { return m_Valid; }

        // Ticks until shutdown, an error, or maxTicks ticks (0 = unbounded).
        [[nodiscard]] Core::Result Run(uint64_t maxTicks = 0);

        // Platform events and one session poll. Called once from the constructor.
        [[nodiscard]] Core::Expected<XR::SessionTransition> Update();

        [[nodiscard]] Core::Expected<TickStatus> Tick();

        // Application hooks.
        virtual void OnStart() {}
        virtual void OnUpdate(float deltaTime) { (void)deltaTime; }

        void SetLights(std::vector<Graphics::Light> lights) { m_Lights = std::move(lights); }

        [[nodiscard]] ECS::Scene& GetScene() { return m_Scene; }
        [[nodiscard]] Physics::PhysicsWorld& GetPhysics() { return *m_Physics; }
        [[nodiscard]] Graphics::ResourceArena& GetArena() { return *m_Arena; }
        [[nodiscard]] XR::HapticContext& GetHaptics() { return m_Haptics; }
        [[nodiscard]] const XR::SessionDriver& GetSessionDriver() const { return *m_SessionDriver; }
        [[nodiscard]] const FrameController& GetFrameController() const { return *m_FrameController; }
        [[nodiscard]] const std::optional<XR::SessionTransition>& GetLastTransition() const { return m_LastTransition; }
        [[nodiscard]] bool IsResumed() const { return m_Resumed; }
        [[nodiscard]] uint64_t GetTickCount() const { return m_TickCount; }

    protected:
        EngineConfig m_Config;
        EngineServices m_Services;

        ECS::Scene m_Scene;
        std::unique_ptr<Physics::PhysicsWorld> m_Physics;
        std::unique_ptr<Graphics::ResourceArena> m_Arena;
        std::unique_ptr<XR::SessionDriver> m_SessionDriver;
        std::unique_ptr<FrameController> m_FrameController;
        XR::HapticContext m_Haptics;
        std::vector<Graphics::Light> m_Lights;

    private:
        void ProcessPlatformEvents();
        [[nodiscard]] Core::Expected<TickStatus> AdvanceTick();
        [[nodiscard]] Core::Result RenderFrame();

        std::optional<XR::SessionTransition> m_LastTransition;
        std::chrono::steady_clock::time_point m_LastTickTime;
        uint64_t m_TickCount = 0;
        bool m_Resumed = true;
        bool m_Valid = true;
    };
}
