#include <format>
#include <stdexcept>
#include <string>
#include <vector>
#define SDL_MAIN_USE_CALLBACKS 1
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <autorelease/AutoRelease.hpp>

#include "config.hpp"
#include "gameobject.hpp"
#include "hud.hpp"

template <>
struct std::formatter<glm::vec2>
{
    static constexpr auto parse(const std::format_parse_context& ctx) { return ctx.begin(); }

    static auto format(const glm::vec2& v, std::format_context& ctx)
    {
        return std::format_to(ctx.out(), "[x: {} y: {}]", v.x, v.y);
    }
};

template <>
struct std::formatter<Cooldown>
{
    static constexpr auto parse(const std::format_parse_context& ctx) { return ctx.begin(); }

    static auto format(const Cooldown& c, std::format_context& ctx)
    {
        return std::format_to(ctx.out(), "{}/{} a: {} p: {}", c.getRemaining(), c.getDuration(), c.isActive(),
                              c.isPaused());
    }
};

typedef struct SDLState
{
    AutoRelease<bool> sdl_init;
    AutoRelease<SDL_Window*> window;
    AutoRelease<SDL_Renderer*> renderer;
    int width{}, height{};
    int logW{}, logH{}; // logical width/height
    const bool* keys{};
    uint64_t prevTime{};
    bool fullscreen{};

    ~SDLState() = default;
} SDLState;

struct GameState
{
    GameObject player{};
    std::vector<GameObject> bullets{};
    std::vector<CooldownBar> bars{};
    float accumulator{}; // seconds not yet simulated
    uint64_t tickCount{};
    bool debugMode{};
};

typedef struct AppState
{
    SDLState sdlState{};
    GameState gameState{};
} AppState;

void requireSDL(bool ok, const char* what);
void createPlayer(const SDLState* state, GameState* gs);
void update(const SDLState* state, GameState* gs);
void spawnBullet(GameState* gs, const GameObject& shooter);
void drawObject(const SDLState* state, const GameObject& obj);

SDL_AppResult SDL_AppInit(void** appstate, int argc, char* argv[])
{
    if (!SDL_SetAppMetadata("Cooldown Demo", "1.0", "com.cooldown.demo"))
    {
        return SDL_APP_FAILURE;
    }

    void* raw = SDL_calloc(1, sizeof(AppState));
    if (!raw)
    {
        return SDL_APP_FAILURE;
    }
    // SDL_calloc only zeroes memory, placement new runs the C++ constructors.
    // AppState never moves afterwards, cooldown callbacks rely on that.
    auto* as = new(raw) AppState();

    *appstate = as;
    auto* ss = &as->sdlState;
    auto* gs = &as->gameState;

    ss->sdl_init = {SDL_Init(SDL_INIT_VIDEO), [](const bool&) { SDL_Quit(); }};
    if (!ss->sdl_init)
    {
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Error", SDL_GetError(), nullptr);
        return SDL_APP_FAILURE;
    }

    ss->width = config::WINDOW_WIDTH;
    ss->height = config::WINDOW_HEIGHT;
    ss->window = {
        SDL_CreateWindow("Cooldown Demo", ss->width, ss->height, SDL_WINDOW_RESIZABLE), SDL_DestroyWindow
    };
    if (!ss->window)
    {
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Error", SDL_GetError(), nullptr);
        return SDL_APP_FAILURE;
    }
    ss->renderer = {SDL_CreateRenderer(ss->window, NULL), SDL_DestroyRenderer};
    if (!ss->renderer)
    {
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Error", SDL_GetError(), ss->window);
        return SDL_APP_FAILURE;
    }

    try
    {
        requireSDL(SDL_SetRenderVSync(ss->renderer, 1), "SDL_SetRenderVSync");

        // SDL_LOGICAL_PRESENTATION_LETTERBOX keeps aspect ratio logW/logH, adding black banners as needed
        ss->logW = config::LOGICAL_WIDTH;
        ss->logH = config::LOGICAL_HEIGHT;
        requireSDL(SDL_SetRenderLogicalPresentation(ss->renderer, ss->logW, ss->logH,
                                                    SDL_LOGICAL_PRESENTATION_LETTERBOX),
                   "SDL_SetRenderLogicalPresentation");
    }
    catch (const std::runtime_error& e)
    {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "%s", e.what());
        SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Error", e.what(), ss->window);
        return SDL_APP_FAILURE;
    }

    ss->keys = SDL_GetKeyboardState(nullptr);

    createPlayer(ss, gs);
    gs->bars = {
        {"Weapon", &gs->player.player.weaponCooldown},
        {"Dash", &gs->player.player.dashCooldown},
    };

    SDL_Log("A/D move, J shoot, K dash, P pause cooldowns, R reset cooldowns");

    // getTicks() start with SDL_Init, take it again before the first deltaTime
    ss->prevTime = SDL_GetTicks();
    return SDL_APP_CONTINUE;
}

SDL_AppResult SDL_AppEvent(void* appstate, SDL_Event* event)
{
    auto* ss = &((AppState*)appstate)->sdlState;
    auto* gs = &((AppState*)appstate)->gameState;

    switch (event->type)
    {
    case SDL_EVENT_QUIT:
        {
            return SDL_APP_SUCCESS;
        }
    case SDL_EVENT_WINDOW_RESIZED:
        {
            ss->width = event->window.data1;
            ss->height = event->window.data2;
            break;
        }
    case SDL_EVENT_KEY_UP:
        {
            if (event->key.scancode == SDL_SCANCODE_F12)
            {
                gs->debugMode = !gs->debugMode;
            }
            if (event->key.scancode == SDL_SCANCODE_F11)
            {
                ss->fullscreen = !ss->fullscreen;
                SDL_SetWindowFullscreen(ss->window, ss->fullscreen);
            }
            if (event->key.scancode == SDL_SCANCODE_P)
            {
                if (gs->player.player.abilitiesPaused)
                {
                    gs->player.resumeAbilities();
                }
                else
                {
                    gs->player.pauseAbilities();
                }
                SDL_Log("Cooldowns %s", gs->player.player.abilitiesPaused ? "paused" : "resumed");
            }
            if (event->key.scancode == SDL_SCANCODE_R)
            {
                // silent: no "ready" callbacks fire on reset
                gs->player.resetAbilities();
                SDL_Log("Cooldowns reset");
            }
            break;
        }
    default:
        {
            break;
        }
    }

    return SDL_APP_CONTINUE;
}

SDL_AppResult SDL_AppIterate(void* appstate)
{
    auto* ss = &((AppState*)appstate)->sdlState;
    auto* gs = &((AppState*)appstate)->gameState;

    const uint64_t nowTime = SDL_GetTicks();
    const float deltaTime = (float)(nowTime - ss->prevTime) / 1000.0f;
    ss->prevTime = nowTime;

    // fixed step: cooldowns count simulation ticks, not frames or seconds
    gs->accumulator += deltaTime;
    int ticks = 0;
    while (gs->accumulator >= config::TICK_SECONDS && ticks < config::MAX_TICKS_PER_FRAME)
    {
        update(ss, gs);
        gs->accumulator -= config::TICK_SECONDS;
        ++ticks;
    }
    if (ticks == config::MAX_TICKS_PER_FRAME && gs->accumulator >= config::TICK_SECONDS)
    {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Dropping %.3fs of simulation time", gs->accumulator);
        gs->accumulator = 0;
    }

    // draw
    SDL_SetRenderDrawColor(ss->renderer, 20, 10, 30, 255);
    SDL_RenderClear(ss->renderer);

    const SDL_FRect ground{
        .x = 0, .y = ss->logH - config::GROUND_HEIGHT, .w = static_cast<float>(ss->logW), .h = config::GROUND_HEIGHT
    };
    SDL_SetRenderDrawColor(ss->renderer, 60, 45, 35, 255);
    SDL_RenderFillRect(ss->renderer, &ground);

    drawObject(ss, gs->player);
    for (const auto& bullet : gs->bullets)
    {
        if (bullet.bullet.state != BulletState::inactive)
        {
            drawObject(ss, bullet);
        }
    }

    drawHud(ss->renderer, gs->bars);
    if (gs->player.player.abilitiesPaused)
    {
        SDL_SetRenderDrawColor(ss->renderer, 255, 255, 255, 255);
        SDL_RenderDebugText(ss->renderer, config::BAR_X, config::BAR_Y + gs->bars.size() * config::BAR_SPACING,
                            "PAUSED");
    }

    if (gs->debugMode)
    {
        SDL_SetRenderDrawColor(ss->renderer, 255, 255, 255, 255);
        SDL_RenderDebugText(ss->renderer, 5, ss->logH - 35,
                            std::format("S: {} B: {} T: {} dt: {} FPS: {}",
                                        static_cast<int>(gs->player.player.state),
                                        gs->bullets.size(),
                                        gs->tickCount,
                                        deltaTime,
                                        1.0f / deltaTime
                            ).c_str()
        );
        SDL_RenderDebugText(ss->renderer, 5, ss->logH - 25,
                            std::format("W: {} D: {}", gs->player.player.weaponCooldown,
                                        gs->player.player.dashCooldown).c_str()
        );
        SDL_RenderDebugText(ss->renderer, 5, ss->logH - 15,
                            std::format("Pos: {} Vel: {}", gs->player.position, gs->player.velocity).c_str()
        );
    }

    SDL_RenderPresent(ss->renderer);

    return SDL_APP_CONTINUE;
}

void SDL_AppQuit(void* appstate, SDL_AppResult result)
{
    auto* as = (AppState*)appstate;
    if (!as)
    {
        return;
    }
    as->~AppState();
    SDL_free(as);
}

void requireSDL(const bool ok, const char* what)
{
    if (!ok)
    {
        throw std::runtime_error(std::string(what) + ": " + SDL_GetError());
    }
}

void createPlayer(const SDLState* state, GameState* gs)
{
    GameObject& p = gs->player;
    p.type = ObjectType::player;
    p.collider = {0, 0, config::PLAYER_SIZE, config::PLAYER_SIZE};
    p.position = glm::vec2(state->logW / 2.0f, state->logH - config::GROUND_HEIGHT - config::PLAYER_SIZE);
    p.color = {90, 160, 255, 255};

    // gs->player lives inside AppState, its address is stable
    GameObject* player = &p;
    player->player.dashCooldown.setOnComplete([player]()
    {
        SDL_Log("Dash ready");
        player->flashCooldown.start();
    });
    player->player.dashTimer.setOnComplete([player]()
    {
        player->player.state = PlayerState::idle;
        player->velocity.x = 0;
    });
}

void update(const SDLState* state, GameState* gs)
{
    ++gs->tickCount;

    GameObject& obj = gs->player;
    PlayerData& d = obj.player;
    obj.tickCooldowns();

    if (d.state != PlayerState::dashing)
    {
        float currentDirection = 0;
        if (state->keys[SDL_SCANCODE_A])
        {
            currentDirection += -1;
        }
        if (state->keys[SDL_SCANCODE_D])
        {
            currentDirection += 1;
        }
        // an object always need a direction
        if (currentDirection != 0)
        {
            obj.direction = currentDirection;
        }
        obj.velocity.x = currentDirection * config::PLAYER_SPEED;
        d.state = currentDirection != 0 ? PlayerState::running : PlayerState::idle;

        if (state->keys[SDL_SCANCODE_K])
        {
            obj.tryDash();
        }
    }

    if (state->keys[SDL_SCANCODE_J] && obj.tryShoot())
    {
        spawnBullet(gs, obj);
    }

    obj.position += obj.velocity;
    obj.position.x = glm::clamp(obj.position.x, 0.0f, state->logW - obj.collider.w);

    for (auto& bullet : gs->bullets)
    {
        if (bullet.bullet.state == BulletState::inactive)
        {
            continue;
        }
        bullet.position += bullet.velocity;
        const SDL_FRect r = bullet.GetCollider();
        if (r.x + r.w < 0 || r.x > state->logW)
        {
            bullet.bullet.state = BulletState::inactive;
        }
    }
}

void spawnBullet(GameState* gs, const GameObject& shooter)
{
    GameObject bullet;
    bullet.type = ObjectType::bullet;
    bullet.bullet = BulletData();
    bullet.direction = shooter.direction;
    bullet.collider = {0, 0, config::BULLET_SIZE, config::BULLET_SIZE};
    bullet.velocity = glm::vec2(config::BULLET_SPEED * shooter.direction, 0);
    bullet.color = {255, 230, 120, 255};

    // spawn at the shooter's front edge (lerp)
    constexpr float left = 0;
    const float right = shooter.collider.w - bullet.collider.w;
    const float t = (shooter.direction + 1) / 2.0f; // 0 to 1
    bullet.position = glm::vec2(shooter.position.x + left + right * t,
                                shooter.position.y + shooter.collider.h / 2.0f);

    // reuse inactive slots
    for (auto& bullet_obj : gs->bullets)
    {
        if (bullet_obj.bullet.state == BulletState::inactive)
        {
            bullet_obj = std::move(bullet);
            return;
        }
    }
    gs->bullets.push_back(std::move(bullet));
}

void drawObject(const SDLState* state, const GameObject& obj)
{
    const SDL_FRect dst = obj.GetCollider();

    if (obj.isFlashing())
    {
        // flash object with a red-ish tint
        SDL_SetRenderDrawColor(state->renderer, 255, 120, 120, 255);
    }
    else
    {
        SDL_SetRenderDrawColor(state->renderer, obj.color.r, obj.color.g, obj.color.b, obj.color.a);
    }
    SDL_RenderFillRect(state->renderer, &dst);
}
