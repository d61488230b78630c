// Status container: stacking, refresh, periodic ticks and stat modifiers.
#include <cassert>

#include "../engine/core/Logger.h"
#include "../engine/status/StatusContainer.h"
#include "../game/status/StatusCatalog.h"

using namespace Forge::Status;
using Forge::Gameplay::StatKind;

int main() {
    Forge::Logger::setMinLevel(Forge::LogLevel::Silent);
    const Pets::StatusCatalog catalog;

    // Burn stacks up to three and refreshes its duration.
    {
        StatusContainer c;
        const StatusSpec burn = catalog.make(StatusType::Burn);
        assert(burn.duration == 2 && burn.maxStacks == 3);
        for (int i = 0; i < 5; ++i) c.apply(burn, "caster");
        assert(c.stacks(StatusType::Burn) == 3);
        assert(c.all().size() == 1);

        // 1000 * 0.05 * 3
        TickResult r = c.tick(1000);
        assert(r.damage == 150 && r.healing == 0 && r.expired == 0);
        c.apply(burn, "caster");
        assert(c.all()[0].remaining == 2);
        c.tick(1000);
        r = c.tick(1000);
        assert(r.expired == 1);
        assert(!c.has(StatusType::Burn));
    }

    // Non-stacking statuses stay at one stack; small hp still ticks for one.
    {
        StatusContainer c;
        c.apply(catalog.make(StatusType::Regeneration), "healer");
        c.apply(catalog.make(StatusType::Regeneration), "healer");
        assert(c.stacks(StatusType::Regeneration) == 1);
        const TickResult r = c.tick(10);
        assert(r.healing == 1);
    }

    // Catalog overrides and tag queries.
    {
        StatusContainer c;
        c.apply(catalog.make(StatusType::Stun, 3), "stunner");
        c.apply(catalog.make(StatusType::Stealth), "self");
        assert(c.all()[0].remaining == 3);
        assert(c.isIncapacitated());
        assert(c.isStealthed());
        assert(c.hasTag(StatusTag::Evasion));
        assert(catalog.make(StatusType::Poison, std::nullopt, 0.2f).magnitude == 0.2f);

        c.purgeIf([](const StatusInstance& inst) { return inst.spec.isDebuff; });
        assert(!c.isIncapacitated());
        assert(c.isStealthed());
        c.remove(StatusType::Stealth);
        assert(c.empty());
    }

    // Infinite statuses survive ticks and a soft clear.
    {
        StatusContainer c;
        StatusSpec aura = catalog.make(StatusType::Regeneration, 0);
        c.apply(aura, "relic");
        c.apply(catalog.make(StatusType::Poison), "foe");
        for (int i = 0; i < 5; ++i) c.tick(100);
        assert(c.has(StatusType::Regeneration));
        assert(!c.has(StatusType::Poison));
        c.apply(catalog.make(StatusType::Poison), "foe");
        c.clear();
        assert(c.has(StatusType::Regeneration) && !c.has(StatusType::Poison));
        c.clear(true);
        assert(c.empty());
    }

    // Modifiers: totals per stat, permanent entries never expire.
    {
        std::vector<StatModifier> mods;
        mods.push_back(StatModifier{StatKind::Attack, 20.0f, 2, false, "cry"});
        mods.push_back(StatModifier{StatKind::Attack, -10.0f, 1, false, "weaken"});
        mods.push_back(StatModifier{StatKind::Defense, 20.0f, 0, true, "hide"});
        assert(modifierTotal(mods, StatKind::Attack) == 10.0f);
        assert(modifierTotal(mods, StatKind::Speed) == 0.0f);

        assert(tickModifiers(mods) == 1);
        assert(modifierTotal(mods, StatKind::Attack) == 20.0f);
        assert(tickModifiers(mods) == 1);
        assert(mods.size() == 1 && mods[0].permanent);
        for (int i = 0; i < 10; ++i) tickModifiers(mods);
        assert(modifierTotal(mods, StatKind::Defense) == 20.0f);
    }

    return 0;
}
