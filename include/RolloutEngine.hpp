//
// Created by moinshaikh on 3/6/26.
//

#pragma once
#include"Agents/A2CAgent.hpp"
#include"Agents/ActorCriticAgent.hpp"
#include"Agents/Agent.hpp"


#include"Distribution/Bernoulli.hpp"
#include"Distribution/Categorical.hpp"
#include"Distribution/Distribution.hpp"
#include"Distribution/Normal.hpp"


#include"Model/CnnBase.hpp"
#include"Model/MlpBase.hpp"
#include"Model/ModelUtils.hpp"
#include"Model/NNBase.hpp"
#include"Model/OutputLayers.hpp"
#include"Model/Policy.hpp"


#include"Processor/FeatureProcessor.hpp"
#include"Processor/FrameScaler.hpp"
#include"Processor/ObservationNormalizer.hpp"
#include"Processor/RunningMeanStd.hpp"


#include"Telemetry/SpdlogTelemetrySink.hpp"
#include"Telemetry/TelemetrySink.hpp"

#include"AdvantageEstimator.hpp"
#include"AgentConfig.hpp"
#include"EpisodicTracker.hpp"
#include"ExperienceStore.hpp"
#include"Space.hpp"
