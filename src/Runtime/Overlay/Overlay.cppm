export module Overlay;

export import :Analytics;
export import :CameraAnchor;
export import :CardPanel;
export import :Components;
export import :Config;
export import :OrientationCard;
export import :TransitionController;
